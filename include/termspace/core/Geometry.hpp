#pragma once
#include <algorithm>

namespace TS {

struct Size {
    int width  = 0;
    int height = 0;

    auto operator==(Size const&) const -> bool = default;
};

// Cell-space rectangle, origin top-left, half-open on the far edges.
struct Rect {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    [[nodiscard]] constexpr auto right() const -> int { return x + width; }
    [[nodiscard]] constexpr auto bottom() const -> int { return y + height; }
    [[nodiscard]] constexpr auto empty() const -> bool { return width <= 0 || height <= 0; }

    [[nodiscard]] constexpr auto contains(int px, int py) const -> bool {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    [[nodiscard]] constexpr auto intersect(Rect const& other) const -> Rect {
        int const left   = std::max(x, other.x);
        int const top    = std::max(y, other.y);
        int const right_ = std::min(right(), other.right());
        int const bottom_ = std::min(bottom(), other.bottom());
        if (right_ <= left || bottom_ <= top)
            return Rect{left, top, 0, 0};
        return Rect{left, top, right_ - left, bottom_ - top};
    }

    auto operator==(Rect const&) const -> bool = default;
};

} // namespace TS
