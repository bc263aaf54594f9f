#include <gtest/gtest.h>
#include <cellflow/paint/box_painter.h>
#include <cellflow/paint/cell_buffer.h>

#include <string>

using namespace cellflow;
using namespace cellflow::paint;

namespace {

CellStyle style_at(int depth, const std::string& layer = "root", std::uint64_t node = 1) {
    CellStyle s;
    s.depth = depth;
    s.layer_id = layer;
    s.node_id = node;
    return s;
}

} // namespace

// 1. A new buffer is blank and fully dirty
TEST(CellBufferTest, StartsBlank) {
    CellBuffer buffer(4, 2);
    EXPECT_EQ(buffer.width(), 4);
    EXPECT_EQ(buffer.height(), 2);
    EXPECT_EQ(buffer.line_text(0), "    ");
    EXPECT_EQ(buffer.cell(0, 0)->layer_id, "root");
    EXPECT_TRUE(buffer.fully_dirty());
    EXPECT_EQ(buffer.dirty_count(), 8u);
}

// 2. Out-of-range reads and writes are ignored
TEST(CellBufferTest, OutOfBounds) {
    CellBuffer buffer(3, 3);
    EXPECT_EQ(buffer.cell(3, 0), nullptr);
    EXPECT_EQ(buffer.cell(-1, 0), nullptr);
    Cell c;
    c.ch = "x";
    c.depth = 0;
    EXPECT_FALSE(buffer.set_cell(5, 5, c));
    EXPECT_EQ(buffer.write_text(-2, 1, "abcd", style_at(0)), 2);
    EXPECT_EQ(buffer.line_text(1), "cd ");
}

// 3. Deeper writes win; equal depth goes to the later write
TEST(CellBufferTest, DepthOrdering) {
    CellBuffer buffer(3, 1);
    buffer.write_text(0, 0, "a", style_at(5, "top", 1));
    buffer.write_text(0, 0, "b", style_at(2, "low", 2));
    EXPECT_EQ(buffer.cell(0, 0)->ch, "a");
    EXPECT_EQ(buffer.cell(0, 0)->layer_id, "top");

    buffer.write_text(0, 0, "c", style_at(5, "tie", 3));
    EXPECT_EQ(buffer.cell(0, 0)->ch, "c");
    EXPECT_EQ(buffer.cell(0, 0)->node_id, 3u);
}

// 4. Negative depths still paint over empty cells
TEST(CellBufferTest, NegativeDepthPaintsOnEmpty) {
    CellBuffer buffer(2, 1);
    EXPECT_EQ(buffer.write_text(0, 0, "z", style_at(-100)), 1);
    EXPECT_EQ(buffer.cell(0, 0)->depth, -100);
}

// 5. Writes outside the clip rectangle are skipped
TEST(CellBufferTest, WriteTextClips) {
    CellBuffer buffer(10, 1);
    layout::Rect clip{2, 0, 3, 1};
    EXPECT_EQ(buffer.write_text(0, 0, "abcdefg", style_at(0), clip), 3);
    EXPECT_EQ(buffer.line_text(0), "  cde     ");
}

// 6. Text keeps the background painted under it
TEST(CellBufferTest, TextInheritsBackground) {
    CellBuffer buffer(3, 1);
    Cell fill;
    fill.background = "blue";
    fill.depth = 0;
    buffer.fill_region({0, 0, 3, 1}, fill);

    CellStyle text = style_at(0);
    text.foreground = "white";
    buffer.write_text(1, 0, "x", text);
    EXPECT_EQ(buffer.cell(1, 0)->background, "blue");
    EXPECT_EQ(buffer.cell(1, 0)->foreground, "white");
}

// 7. Resize keeps the overlapping content
TEST(CellBufferTest, ResizeKeepsOverlap) {
    CellBuffer buffer(4, 2);
    buffer.write_text(0, 0, "abcd", style_at(0));
    buffer.write_text(0, 1, "efgh", style_at(0));

    buffer.resize(2, 3);
    EXPECT_EQ(buffer.width(), 2);
    EXPECT_EQ(buffer.height(), 3);
    EXPECT_EQ(buffer.line_text(0), "ab");
    EXPECT_EQ(buffer.line_text(1), "ef");
    EXPECT_EQ(buffer.line_text(2), "  ");
    EXPECT_TRUE(buffer.fully_dirty());
}

// 8. Dirty tracking after mark_clean
TEST(CellBufferTest, DirtyTracking) {
    CellBuffer buffer(5, 2);
    buffer.mark_clean();
    EXPECT_EQ(buffer.dirty_count(), 0u);

    buffer.write_text(1, 1, "ab", style_at(0));
    EXPECT_EQ(buffer.dirty_count(), 2u);
    EXPECT_TRUE(buffer.is_dirty(1, 1));
    EXPECT_FALSE(buffer.is_dirty(0, 0));

    // Same appearance does not dirty the cell again.
    buffer.mark_clean();
    buffer.write_text(1, 1, "a", style_at(0));
    EXPECT_EQ(buffer.dirty_count(), 0u);

    buffer.clear_region({0, 0, 2, 1});
    EXPECT_EQ(buffer.dirty_count(), 2u);
}

// 9. clear resets every cell
TEST(CellBufferTest, ClearResets) {
    CellBuffer buffer(3, 1);
    buffer.write_text(0, 0, "abc", style_at(9));
    buffer.clear();
    EXPECT_EQ(buffer.line_text(0), "   ");
    EXPECT_EQ(buffer.cell(0, 0)->depth, core::config::kEmptyCellDepth);
}

// 10. Borders draw box characters around the rectangle
TEST(CellBufferTest, PaintBorder) {
    CellBuffer buffer(4, 3);
    style::ComputedStyle cs;
    cs.border_style = style::BorderStyle::Single;
    PaintContext ctx;
    paint_border(buffer, {0, 0, 4, 3}, cs, 1, ctx);

    auto lines = buffer.lines();
    EXPECT_EQ(lines[0], "┌──┐");
    EXPECT_EQ(lines[1], "│  │");
    EXPECT_EQ(lines[2], "└──┘");
}

// 11. Multi-line paint stops at the bottom of its area
TEST(CellBufferTest, PaintLinesCutToArea) {
    CellBuffer buffer(6, 3);
    PaintContext ctx;
    paint_lines(buffer, {1, 0, 3, 2}, {"hello", "world", "again"}, style_at(0), ctx);

    EXPECT_EQ(buffer.line_text(0), " hel  ");
    EXPECT_EQ(buffer.line_text(1), " wor  ");
    EXPECT_EQ(buffer.line_text(2), "      ");
}
