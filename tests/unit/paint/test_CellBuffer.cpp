#include <doctest/doctest.h>

#include <termspace/paint/CellBuffer.hpp>
#include <termspace/paint/DirtyTracker.hpp>
#include <termspace/paint/PaintContext.hpp>

using namespace TS;

TEST_SUITE("paint.cell_buffer") {

TEST_CASE("drawText clips to the grid and counts code points") {
    CellBuffer buffer(6, 2);
    CHECK(buffer.drawText(3, 0, "héllo") == 3);
    CHECK(buffer.row(0) == "   hél");
    CHECK(buffer.drawText(-2, 1, "abcd") == 2);
    CHECK(buffer.row(1) == "cd    ");
    CHECK(buffer.drawText(0, 5, "x") == 0);
    CHECK_FALSE(buffer.setCell(6, 0, Cell{U'x'}));
}

TEST_CASE("decodeUtf8 replaces broken sequences") {
    CHECK(decodeUtf8("a\x80z") == U"a\uFFFDz");
    CHECK(decodeUtf8("\xe2\x82") == U"\uFFFD");
}

TEST_CASE("diff reports changed row spans") {
    CellBuffer before(10, 3);
    CellBuffer after(10, 3);
    after.drawText(2, 1, "ab");
    after.setCell(7, 1, Cell{U'z'});
    auto spans = after.diff(before);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0] == Rect{2, 1, 6, 1});
    CHECK(before.diff(before).empty());

    CellBuffer resized(5, 3);
    CHECK(resized.diff(before) == std::vector<Rect>{Rect{0, 0, 5, 3}});
}

TEST_CASE("renderSpans positions the cursor and resets styles") {
    CellBuffer buffer(4, 2);
    CellStyle  bold;
    bold.bold = true;
    buffer.drawText(1, 1, "hi", bold);
    auto out = buffer.renderSpans({Rect{1, 1, 2, 1}});
    CHECK(out == "\x1b[2;2H\x1b[0;1mhi\x1b[0m");
    CHECK(buffer.renderSpans({}).empty());
}

TEST_CASE("paint context draws relative to its bounds") {
    CellBuffer   buffer(8, 3);
    PaintContext ctx(buffer, Rect{2, 1, 3, 1});
    CHECK(ctx.drawText(0, 0, "abcdef") == 3);
    CHECK(buffer.row(1) == "  abc   ");
    CHECK_FALSE(ctx.setCell(0, 1, Cell{U'x'}));
    ctx.fill(Cell{U'#'});
    CHECK(buffer.row(1) == "  ###   ");
    auto focused = ctx.withFocus(true);
    CHECK(focused.focused);
    CHECK_FALSE(ctx.focused);
}

} // TEST_SUITE

TEST_SUITE("paint.dirty_tracker") {

TEST_CASE("starts fully dirty and clears") {
    DirtyTracker dirty(Size{10, 5});
    CHECK(dirty.isAllDirty());
    CHECK(dirty.rects() == std::vector<Rect>{Rect{0, 0, 10, 5}});
    dirty.clear();
    CHECK_FALSE(dirty.hasDirty());
}

TEST_CASE("marks are clamped and deduplicated") {
    DirtyTracker dirty(Size{10, 5});
    dirty.clear();
    dirty.mark(Rect{8, 3, 5, 5});
    dirty.mark(Rect{9, 4, 1, 1});
    dirty.mark(Rect{20, 20, 2, 2});
    CHECK(dirty.rects() == std::vector<Rect>{Rect{8, 3, 2, 2}});
    CHECK(dirty.isDirty(9, 4));
    CHECK_FALSE(dirty.isDirty(0, 0));
}

TEST_CASE("a bounds change marks everything") {
    DirtyTracker dirty(Size{10, 5});
    dirty.clear();
    dirty.setBounds(Size{10, 5});
    CHECK_FALSE(dirty.hasDirty());
    dirty.setBounds(Size{12, 5});
    CHECK(dirty.isAllDirty());
}

} // TEST_SUITE
