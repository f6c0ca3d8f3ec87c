#include <termspace/paint/DirtyTracker.hpp>

namespace TS {

DirtyTracker::DirtyTracker(Size bounds)
    : bounds_(bounds) {}

auto DirtyTracker::setBounds(Size bounds) -> void {
    if (bounds == this->bounds_)
        return;
    this->bounds_ = bounds;
    this->markAll();
}

auto DirtyTracker::markAll() -> void {
    this->all = true;
    this->regions.clear();
}

auto DirtyTracker::mark(Rect const& rect) -> void {
    if (this->all)
        return;
    auto clipped = rect.intersect(Rect{0, 0, this->bounds_.width, this->bounds_.height});
    if (clipped.empty())
        return;
    for (auto const& existing : this->regions)
        if (existing.intersect(clipped) == clipped)
            return;
    this->regions.push_back(clipped);
}

auto DirtyTracker::markCell(int x, int y) -> void {
    this->mark(Rect{x, y, 1, 1});
}

auto DirtyTracker::clear() -> void {
    this->all = false;
    this->regions.clear();
}

auto DirtyTracker::isDirty(int x, int y) const -> bool {
    if (this->all)
        return x >= 0 && y >= 0 && x < this->bounds_.width && y < this->bounds_.height;
    for (auto const& region : this->regions)
        if (region.contains(x, y))
            return true;
    return false;
}

auto DirtyTracker::rects() const -> std::vector<Rect> {
    if (this->all)
        return {Rect{0, 0, this->bounds_.width, this->bounds_.height}};
    return this->regions;
}

} // namespace TS
