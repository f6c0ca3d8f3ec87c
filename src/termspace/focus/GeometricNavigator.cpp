#include <termspace/focus/GeometricNavigator.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace TS {

namespace {
auto centerX(Rect const& r) -> double {
    return r.x + r.width / 2.0;
}

auto centerY(Rect const& r) -> double {
    return r.y + r.height / 2.0;
}

auto overlap(int aStart, int aLength, int bStart, int bLength) -> int {
    int const start = std::max(aStart, bStart);
    int const end   = std::min(aStart + aLength, bStart + bLength);
    return std::max(end - start, 0);
}
} // namespace

auto toString(NavDirection direction) -> std::string_view {
    switch (direction) {
    case NavDirection::Up:
        return "up";
    case NavDirection::Down:
        return "down";
    case NavDirection::Left:
        return "left";
    case NavDirection::Right:
        return "right";
    }
    return "up";
}

auto GeometricNavigator::isCandidate(Rect const& from, Rect const& to, NavDirection direction) -> bool {
    if (to.empty())
        return false;
    switch (direction) {
    case NavDirection::Up:
        return to.bottom() <= from.y || centerY(to) < centerY(from);
    case NavDirection::Down:
        return to.y >= from.bottom() || centerY(to) > centerY(from);
    case NavDirection::Left:
        return to.right() <= from.x || centerX(to) < centerX(from);
    case NavDirection::Right:
        return to.x >= from.right() || centerX(to) > centerX(from);
    }
    return false;
}

auto GeometricNavigator::score(Rect const& from, Rect const& to, NavDirection direction) -> double {
    bool const vertical = direction == NavDirection::Up || direction == NavDirection::Down;
    double const distance = vertical ? std::abs(centerY(to) - centerY(from)) : std::abs(centerX(to) - centerX(from));
    double const primary  = (1000.0 - distance) / 1000.0;

    int const shared = vertical ? overlap(from.x, from.width, to.x, to.width) : overlap(from.y, from.height, to.y, to.height);
    int const extent = vertical ? std::max(from.width, to.width) : std::max(from.height, to.height);
    double const secondary = extent > 0 ? 0.5 * static_cast<double>(shared) / static_cast<double>(extent) : 0.0;
    return primary + secondary;
}

auto GeometricNavigator::findNext(std::vector<FocusCandidate> const& candidates,
                                  std::optional<std::string> const& current,
                                  NavDirection                       direction) -> std::optional<std::string> {
    FocusCandidate const* origin = nullptr;
    if (current) {
        auto it = std::find_if(candidates.begin(), candidates.end(), [&](FocusCandidate const& c) { return c.id == *current; });
        if (it != candidates.end())
            origin = &*it;
    }

    if (origin == nullptr) {
        FocusCandidate const* best = nullptr;
        for (auto const& candidate : candidates) {
            if (candidate.bounds.empty())
                continue;
            if (best == nullptr || candidate.bounds.y < best->bounds.y
                || (candidate.bounds.y == best->bounds.y && candidate.bounds.x < best->bounds.x))
                best = &candidate;
        }
        if (best == nullptr)
            return std::nullopt;
        return best->id;
    }

    FocusCandidate const* best      = nullptr;
    double                bestScore = std::numeric_limits<double>::lowest();
    for (auto const& candidate : candidates) {
        if (&candidate == origin || !isCandidate(origin->bounds, candidate.bounds, direction))
            continue;
        auto const s = score(origin->bounds, candidate.bounds, direction);
        if (s > bestScore) {
            bestScore = s;
            best      = &candidate;
        }
    }
    if (best == nullptr)
        return std::nullopt;
    return best->id;
}

} // namespace TS
