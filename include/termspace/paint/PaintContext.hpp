#pragma once
#include <termspace/core/FocusPath.hpp>
#include <termspace/core/Geometry.hpp>
#include <termspace/paint/CellBuffer.hpp>

#include <string_view>

namespace TS {

/**
 * Drawing surface handed to Paintable::paint. Coordinates passed to the
 * drawing helpers are relative to bounds and clipped to it.
 */
class PaintContext {
public:
    PaintContext(CellBuffer& buffer, Rect bounds);

    [[nodiscard]] auto buffer() -> CellBuffer& { return *this->target; }
    [[nodiscard]] auto bounds() const -> Rect const& { return this->area; }

    auto drawText(int x, int y, std::string_view text, CellStyle style = {}) -> int;
    auto fill(Cell value) -> void;
    auto setCell(int x, int y, Cell value) -> bool;

    [[nodiscard]] auto withBounds(Rect bounds) const -> PaintContext;
    [[nodiscard]] auto withFocus(bool value) const -> PaintContext;

    bool      focused  = false;
    bool      disabled = false;
    int       zIndex   = 0;
    FocusPath focusPath;

private:
    CellBuffer* target;
    Rect        area;
};

// Capability of components that draw themselves.
class Paintable {
public:
    virtual ~Paintable()                        = default;
    virtual auto paint(PaintContext& ctx) -> void = 0;
};

} // namespace TS
