#pragma once
#include <termspace/core/Geometry.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

struct CellStyle {
    bool          bold      = false;
    bool          underline = false;
    bool          italic    = false;
    bool          reverse   = false;
    std::uint8_t  fg        = 0; // 0 = terminal default, else 256-color index + 1
    std::uint8_t  bg        = 0;

    auto operator==(CellStyle const&) const -> bool = default;
};

struct Cell {
    char32_t  ch = U' ';
    CellStyle style;

    auto operator==(Cell const&) const -> bool = default;
};

/**
 * Width x height grid of styled cells, row-major. Writes outside the grid
 * are ignored.
 */
class CellBuffer {
public:
    CellBuffer() = default;
    CellBuffer(int width, int height);

    [[nodiscard]] auto width() const -> int { return this->width_; }
    [[nodiscard]] auto height() const -> int { return this->height_; }
    [[nodiscard]] auto size() const -> Size { return Size{this->width_, this->height_}; }
    [[nodiscard]] auto bounds() const -> Rect { return Rect{0, 0, this->width_, this->height_}; }

    // Resizing discards the contents.
    auto resize(int width, int height) -> void;
    auto clear() -> void;

    [[nodiscard]] auto cell(int x, int y) const -> Cell const*;
    auto setCell(int x, int y, Cell value) -> bool;

    // Writes UTF-8 text on one row, clipped to clip and the grid. Returns the
    // number of cells written.
    auto drawText(int x, int y, std::string_view text, CellStyle style = {}) -> int;
    auto drawText(int x, int y, std::string_view text, CellStyle style, Rect const& clip) -> int;
    auto fill(Rect const& area, Cell value) -> void;

    [[nodiscard]] auto row(int y) const -> std::string;
    // Rows joined by '\n', trailing spaces kept.
    [[nodiscard]] auto toString() const -> std::string;

    // Row spans whose cells differ from previous; everything when sizes differ.
    [[nodiscard]] auto diff(CellBuffer const& previous) const -> std::vector<Rect>;
    // ANSI output repainting the given spans.
    [[nodiscard]] auto renderSpans(std::vector<Rect> const& spans) const -> std::string;

    auto operator==(CellBuffer const&) const -> bool = default;

private:
    [[nodiscard]] auto index(int x, int y) const -> std::size_t {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(this->width_) + static_cast<std::size_t>(x);
    }

    int               width_  = 0;
    int               height_ = 0;
    std::vector<Cell> cells;
};

[[nodiscard]] auto decodeUtf8(std::string_view text) -> std::u32string;

} // namespace TS
