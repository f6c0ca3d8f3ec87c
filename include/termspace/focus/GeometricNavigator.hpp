#pragma once
#include <termspace/core/Geometry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

enum class NavDirection : std::uint8_t {
    Up = 0,
    Down,
    Left,
    Right
};

[[nodiscard]] auto toString(NavDirection direction) -> std::string_view;

struct FocusCandidate {
    std::string id;
    Rect        bounds;
};

/**
 * Spatial focus moves.
 *
 * A candidate qualifies when it lies fully past the current node's edge in
 * the move direction, or its center is past the current center. Qualifying
 * candidates are scored by closeness of centers along the move axis plus a
 * bonus of up to 0.5 for overlap on the cross axis; the best score wins.
 * Zero-sized candidates never qualify.
 */
class GeometricNavigator {
public:
    [[nodiscard]] static auto isCandidate(Rect const& from, Rect const& to, NavDirection direction) -> bool;
    [[nodiscard]] static auto score(Rect const& from, Rect const& to, NavDirection direction) -> double;

    // With no (known) current id the top-left-most candidate is chosen.
    [[nodiscard]] static auto findNext(std::vector<FocusCandidate> const& candidates,
                                       std::optional<std::string> const& current,
                                       NavDirection                       direction) -> std::optional<std::string>;
};

} // namespace TS
