#include <termspace/paint/PaintContext.hpp>

namespace TS {

PaintContext::PaintContext(CellBuffer& buffer, Rect bounds)
    : target(&buffer), area(bounds) {}

auto PaintContext::drawText(int x, int y, std::string_view text, CellStyle style) -> int {
    return this->target->drawText(this->area.x + x, this->area.y + y, text, style, this->area);
}

auto PaintContext::fill(Cell value) -> void {
    this->target->fill(this->area, value);
}

auto PaintContext::setCell(int x, int y, Cell value) -> bool {
    if (!this->area.contains(this->area.x + x, this->area.y + y))
        return false;
    return this->target->setCell(this->area.x + x, this->area.y + y, value);
}

auto PaintContext::withBounds(Rect bounds) const -> PaintContext {
    PaintContext copy = *this;
    copy.area         = bounds;
    return copy;
}

auto PaintContext::withFocus(bool value) const -> PaintContext {
    PaintContext copy = *this;
    copy.focused      = value;
    return copy;
}

} // namespace TS
