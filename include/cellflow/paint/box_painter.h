#pragma once
#include <cellflow/paint/cell_buffer.h>
#include <cellflow/paint/paint_context.h>
#include <cellflow/style/computed_style.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cellflow::paint {

struct BorderChars {
    const char* top_left;
    const char* top_right;
    const char* bottom_left;
    const char* bottom_right;
    const char* horizontal;
    const char* vertical;
};

BorderChars border_chars(style::BorderStyle border);

CellStyle cell_style_for(const style::ComputedStyle& computed, std::uint64_t node_id,
                         const PaintContext& ctx);

// Background fill of `rect`; no-op for an empty background color.
void paint_background(CellBuffer& buffer, const layout::Rect& rect,
                      const std::string& background, std::uint64_t node_id,
                      const PaintContext& ctx);

void paint_border(CellBuffer& buffer, const layout::Rect& rect, const style::ComputedStyle& computed,
                  std::uint64_t node_id, const PaintContext& ctx);

// Writes `lines` top-down from the top-left of `area`, cut to `area`
// and to the viewport.
void paint_lines(CellBuffer& buffer, const layout::Rect& area,
                 const std::vector<std::string>& lines, const CellStyle& cell_style,
                 const PaintContext& ctx);

} // namespace cellflow::paint
