#pragma once
#include <cstdint>
#include <optional>

namespace TS {

enum class Direction : std::uint8_t {
    Row = 0,
    Column
};

enum class Justify : std::uint8_t {
    Start = 0,
    Center,
    End,
    SpaceBetween,
    SpaceAround,
    SpaceEvenly
};

enum class Align : std::uint8_t {
    Start = 0,
    Center,
    End,
    Stretch
};

enum class AlignSelf : std::uint8_t {
    Auto = 0,
    Start,
    Center,
    End,
    Stretch
};

enum class Overflow : std::uint8_t {
    Visible = 0,
    Hidden,
    Scroll
};

enum class Position : std::uint8_t {
    Relative = 0,
    Absolute
};

struct Insets {
    int top    = 0;
    int right  = 0;
    int bottom = 0;
    int left   = 0;

    [[nodiscard]] static constexpr auto all(int value) -> Insets { return Insets{value, value, value, value}; }
    [[nodiscard]] static constexpr auto symmetric(int vertical, int horizontal) -> Insets {
        return Insets{vertical, horizontal, vertical, horizontal};
    }

    [[nodiscard]] constexpr auto horizontal() const -> int { return left + right; }
    [[nodiscard]] constexpr auto vertical() const -> int { return top + bottom; }

    auto operator==(Insets const&) const -> bool = default;
};

// Layout-relevant style of a node. Width/height/basis use -1 for "auto".
struct Style {
    int width  = -1;
    int height = -1;

    double flexGrow   = 0.0;
    double flexShrink = 1.0;
    int    flexBasis  = -1;

    Direction direction  = Direction::Row;
    Justify   justify    = Justify::Start;
    Align     alignItems = Align::Start;
    AlignSelf alignSelf  = AlignSelf::Auto;
    int       gap        = 0;

    Insets padding;
    Insets border;

    int      zIndex   = 0;
    Overflow overflow = Overflow::Visible;

    Position           position = Position::Relative;
    std::optional<int> left;
    std::optional<int> top;
    std::optional<int> right;
    std::optional<int> bottom;

    [[nodiscard]] auto isAbsolute() const -> bool { return position == Position::Absolute; }

    auto operator==(Style const&) const -> bool = default;
};

} // namespace TS
