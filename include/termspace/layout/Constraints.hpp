#pragma once
#include <termspace/core/Geometry.hpp>

#include <algorithm>
#include <string>

namespace TS {

struct Constraints {
    static constexpr int kUnbounded = 1 << 30;

    int minWidth  = 0;
    int maxWidth  = kUnbounded;
    int minHeight = 0;
    int maxHeight = kUnbounded;

    [[nodiscard]] static constexpr auto tight(int width, int height) -> Constraints {
        width  = std::max(width, 0);
        height = std::max(height, 0);
        return Constraints{width, width, height, height};
    }

    [[nodiscard]] static constexpr auto loose(int width, int height) -> Constraints {
        return Constraints{0, std::max(width, 0), 0, std::max(height, 0)};
    }

    [[nodiscard]] static constexpr auto unbounded() -> Constraints { return Constraints{}; }

    [[nodiscard]] constexpr auto constrainWidth(int width) const -> int {
        return std::clamp(width, minWidth, std::max(minWidth, maxWidth));
    }

    [[nodiscard]] constexpr auto constrainHeight(int height) const -> int {
        return std::clamp(height, minHeight, std::max(minHeight, maxHeight));
    }

    [[nodiscard]] constexpr auto constrain(Size size) const -> Size {
        return Size{constrainWidth(size.width), constrainHeight(size.height)};
    }

    [[nodiscard]] constexpr auto isTight() const -> bool { return minWidth == maxWidth && minHeight == maxHeight; }
    [[nodiscard]] constexpr auto isBounded() const -> bool { return maxWidth < kUnbounded && maxHeight < kUnbounded; }
    [[nodiscard]] constexpr auto hasBoundedWidth() const -> bool { return maxWidth < kUnbounded; }
    [[nodiscard]] constexpr auto hasBoundedHeight() const -> bool { return maxHeight < kUnbounded; }

    // Shrinks the box by fixed insets; unbounded axes stay unbounded.
    [[nodiscard]] constexpr auto deflate(int horizontal, int vertical) const -> Constraints {
        auto shrink = [](int value, int by) { return value >= kUnbounded ? value : std::max(value - by, 0); };
        return Constraints{std::max(minWidth - horizontal, 0), shrink(maxWidth, horizontal), std::max(minHeight - vertical, 0),
                           shrink(maxHeight, vertical)};
    }

    [[nodiscard]] auto toString() const -> std::string;

    auto operator==(Constraints const&) const -> bool = default;
};

} // namespace TS
