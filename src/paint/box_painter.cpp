#include <cellflow/paint/box_painter.h>
#include <cellflow/core/text.h>

namespace cellflow::paint {

BorderChars border_chars(style::BorderStyle border) {
    switch (border) {
        case style::BorderStyle::Double:
            return {"╔", "╗", "╚", "╝", "═", "║"};
        case style::BorderStyle::Thick:
            return {"┏", "┓", "┗", "┛", "━", "┃"};
        case style::BorderStyle::Dashed:
            return {"┌", "┐", "└", "┘", "┄", "┆"};
        case style::BorderStyle::Dotted:
            return {"·", "·", "·", "·", "·", "·"};
        case style::BorderStyle::Ascii:
            return {"+", "+", "+", "+", "-", "|"};
        case style::BorderStyle::Single:
        case style::BorderStyle::None:
            break;
    }
    return {"┌", "┐", "└", "┘", "─", "│"};
}

CellStyle cell_style_for(const style::ComputedStyle& computed, std::uint64_t node_id,
                         const PaintContext& ctx) {
    CellStyle cs;
    cs.foreground = computed.color;
    cs.background = computed.background_color;
    cs.layer_id = ctx.layer_id;
    cs.node_id = node_id;
    cs.depth = ctx.depth;
    return cs;
}

void paint_background(CellBuffer& buffer, const layout::Rect& rect,
                      const std::string& background, std::uint64_t node_id,
                      const PaintContext& ctx) {
    if (background.empty()) return;
    auto visible = ctx.clip(rect);
    if (!visible) return;

    Cell fill;
    fill.ch = " ";
    fill.background = background;
    fill.layer_id = ctx.layer_id;
    fill.node_id = node_id;
    fill.depth = ctx.depth;
    buffer.fill_region(*visible, fill);
}

void paint_border(CellBuffer& buffer, const layout::Rect& rect, const style::ComputedStyle& computed,
                  std::uint64_t node_id, const PaintContext& ctx) {
    if (computed.border_style == style::BorderStyle::None || rect.width < 2 || rect.height < 2) {
        return;
    }
    auto chars = border_chars(computed.border_style);
    CellStyle cs = cell_style_for(computed, node_id, ctx);
    if (!computed.border_color.empty()) cs.foreground = computed.border_color;
    auto clip = ctx.clip_area();

    int x0 = rect.x;
    int y0 = rect.y;
    int x1 = rect.right() - 1;
    int y1 = rect.bottom() - 1;

    buffer.write_text(x0, y0, chars.top_left, cs, clip);
    buffer.write_text(x1, y0, chars.top_right, cs, clip);
    buffer.write_text(x0, y1, chars.bottom_left, cs, clip);
    buffer.write_text(x1, y1, chars.bottom_right, cs, clip);
    for (int x = x0 + 1; x < x1; ++x) {
        buffer.write_text(x, y0, chars.horizontal, cs, clip);
        buffer.write_text(x, y1, chars.horizontal, cs, clip);
    }
    for (int y = y0 + 1; y < y1; ++y) {
        buffer.write_text(x0, y, chars.vertical, cs, clip);
        buffer.write_text(x1, y, chars.vertical, cs, clip);
    }
}

void paint_lines(CellBuffer& buffer, const layout::Rect& area,
                 const std::vector<std::string>& lines, const CellStyle& cell_style,
                 const PaintContext& ctx) {
    auto visible = ctx.clip(area);
    if (!visible) return;

    for (size_t i = 0; i < lines.size(); ++i) {
        int y = area.y + static_cast<int>(i);
        if (y >= area.bottom()) break;
        buffer.write_text(area.x, y, lines[i], cell_style, *visible);
    }
}

} // namespace cellflow::paint
