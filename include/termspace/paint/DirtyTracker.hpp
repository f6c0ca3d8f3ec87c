#pragma once
#include <termspace/core/Geometry.hpp>

#include <vector>

namespace TS {

// Screen regions that need repainting. Starts fully dirty.
class DirtyTracker {
public:
    explicit DirtyTracker(Size bounds = {});

    auto setBounds(Size bounds) -> void;
    [[nodiscard]] auto bounds() const -> Size { return this->bounds_; }

    auto markAll() -> void;
    // Clamped to the bounds; rects falling outside are ignored.
    auto mark(Rect const& rect) -> void;
    auto markCell(int x, int y) -> void;
    auto clear() -> void;

    [[nodiscard]] auto isAllDirty() const -> bool { return this->all; }
    [[nodiscard]] auto isDirty(int x, int y) const -> bool;
    [[nodiscard]] auto hasDirty() const -> bool { return this->all || !this->regions.empty(); }
    // The whole screen when everything is dirty.
    [[nodiscard]] auto rects() const -> std::vector<Rect>;

private:
    Size              bounds_;
    bool              all = true;
    std::vector<Rect> regions;
};

} // namespace TS
