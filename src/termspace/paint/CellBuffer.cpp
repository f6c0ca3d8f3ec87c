#include <termspace/paint/CellBuffer.hpp>
#include <termspace/input/RawInput.hpp>

#include <algorithm>

namespace TS {

namespace {

auto styleSequence(CellStyle const& style) -> std::string {
    std::string sgr = "\x1b[0";
    if (style.bold)
        sgr += ";1";
    if (style.italic)
        sgr += ";3";
    if (style.underline)
        sgr += ";4";
    if (style.reverse)
        sgr += ";7";
    if (style.fg != 0)
        sgr += ";38;5;" + std::to_string(style.fg - 1);
    if (style.bg != 0)
        sgr += ";48;5;" + std::to_string(style.bg - 1);
    return sgr + "m";
}

} // namespace

auto decodeUtf8(std::string_view text) -> std::u32string {
    std::u32string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        auto const  lead   = static_cast<unsigned char>(text[i]);
        std::size_t length = 1;
        char32_t    cp     = lead;
        if (lead >= 0xF0 && lead < 0xF8) {
            length = 4;
            cp     = lead & 0x07;
        } else if (lead >= 0xE0) {
            length = 3;
            cp     = lead & 0x0F;
        } else if (lead >= 0xC0) {
            length = 2;
            cp     = lead & 0x1F;
        } else if (lead >= 0x80) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        if (i + length > text.size()) {
            out.push_back(U'\uFFFD');
            break;
        }
        for (std::size_t k = 1; k < length; ++k)
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        out.push_back(cp);
        i += length;
    }
    return out;
}

CellBuffer::CellBuffer(int width, int height) {
    this->resize(width, height);
}

auto CellBuffer::resize(int width, int height) -> void {
    this->width_  = std::max(width, 0);
    this->height_ = std::max(height, 0);
    this->cells.assign(static_cast<std::size_t>(this->width_) * static_cast<std::size_t>(this->height_), Cell{});
}

auto CellBuffer::clear() -> void {
    std::fill(this->cells.begin(), this->cells.end(), Cell{});
}

auto CellBuffer::cell(int x, int y) const -> Cell const* {
    if (x < 0 || y < 0 || x >= this->width_ || y >= this->height_)
        return nullptr;
    return &this->cells[this->index(x, y)];
}

auto CellBuffer::setCell(int x, int y, Cell value) -> bool {
    if (x < 0 || y < 0 || x >= this->width_ || y >= this->height_)
        return false;
    this->cells[this->index(x, y)] = value;
    return true;
}

auto CellBuffer::drawText(int x, int y, std::string_view text, CellStyle style) -> int {
    return this->drawText(x, y, text, style, this->bounds());
}

auto CellBuffer::drawText(int x, int y, std::string_view text, CellStyle style, Rect const& clip) -> int {
    auto const area = clip.intersect(this->bounds());
    if (area.empty() || y < area.y || y >= area.bottom())
        return 0;
    int written = 0;
    int column  = x;
    for (char32_t ch : decodeUtf8(text)) {
        if (column >= area.right())
            break;
        if (column >= area.x) {
            this->cells[this->index(column, y)] = Cell{ch, style};
            ++written;
        }
        ++column;
    }
    return written;
}

auto CellBuffer::fill(Rect const& area, Cell value) -> void {
    auto const clipped = area.intersect(this->bounds());
    for (int y = clipped.y; y < clipped.bottom(); ++y)
        for (int x = clipped.x; x < clipped.right(); ++x)
            this->cells[this->index(x, y)] = value;
}

auto CellBuffer::row(int y) const -> std::string {
    std::string out;
    if (y < 0 || y >= this->height_)
        return out;
    for (int x = 0; x < this->width_; ++x)
        out += toUtf8(this->cells[this->index(x, y)].ch);
    return out;
}

auto CellBuffer::toString() const -> std::string {
    std::string out;
    for (int y = 0; y < this->height_; ++y) {
        if (y > 0)
            out += '\n';
        out += this->row(y);
    }
    return out;
}

auto CellBuffer::diff(CellBuffer const& previous) const -> std::vector<Rect> {
    if (previous.width_ != this->width_ || previous.height_ != this->height_)
        return {this->bounds()};
    std::vector<Rect> spans;
    for (int y = 0; y < this->height_; ++y) {
        int first = -1;
        int last  = -1;
        for (int x = 0; x < this->width_; ++x) {
            if (!(this->cells[this->index(x, y)] == previous.cells[this->index(x, y)])) {
                if (first < 0)
                    first = x;
                last = x;
            }
        }
        if (first >= 0)
            spans.push_back(Rect{first, y, last - first + 1, 1});
    }
    return spans;
}

auto CellBuffer::renderSpans(std::vector<Rect> const& spans) const -> std::string {
    std::string out;
    for (auto const& span : spans) {
        auto const area = span.intersect(this->bounds());
        for (int y = area.y; y < area.bottom(); ++y) {
            out += "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(area.x + 1) + "H";
            CellStyle const* active = nullptr;
            for (int x = area.x; x < area.right(); ++x) {
                auto const& c = this->cells[this->index(x, y)];
                if (active == nullptr || !(*active == c.style)) {
                    out += styleSequence(c.style);
                    active = &c.style;
                }
                out += toUtf8(c.ch);
            }
        }
    }
    if (!out.empty())
        out += "\x1b[0m";
    return out;
}

} // namespace TS
