#pragma once
#include <cellflow/core/config.h>
#include <cellflow/layout/box.h>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cellflow::paint {

struct Cell {
    std::string ch = " ";
    std::string foreground;  // empty = terminal default
    std::string background;
    std::string layer_id = core::config::kRootLayerId;
    std::uint64_t node_id = 0;
    int depth = core::config::kEmptyCellDepth;

    bool same_appearance(const Cell& o) const {
        return ch == o.ch && foreground == o.foreground && background == o.background;
    }
};

// Style and ownership shared by a run of written cells.
struct CellStyle {
    std::string foreground;
    std::string background;
    std::string layer_id = core::config::kRootLayerId;
    std::uint64_t node_id = 0;
    int depth = 0;
};

// Grid of character cells. A write lands only when its depth is at
// least the depth already stored, so equal depths resolve to the later
// write. Writes outside the grid are dropped.
class CellBuffer {
public:
    CellBuffer(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    layout::Rect rect() const { return {0, 0, width_, height_}; }

    bool in_bounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    // Null when out of bounds.
    const Cell* cell(int x, int y) const;

    // Returns true when the write replaced the stored cell.
    bool set_cell(int x, int y, const Cell& cell);

    // Writes UTF-8 text on one row, one code point per cell, skipping
    // cells outside `clip`. An empty style background keeps the existing
    // one. Returns the number of cells written.
    int write_text(int x, int y, std::string_view text, const CellStyle& style,
                   const std::optional<layout::Rect>& clip = std::nullopt);

    // Depth-checked fill of `region` with copies of `cell`.
    void fill_region(const layout::Rect& region, const Cell& cell);
    // Unconditional reset of `region` to empty cells.
    void clear_region(const layout::Rect& region);
    void clear();

    // Keeps the overlapping top-left content.
    void resize(int width, int height);

    // Line-oriented view for flush stages.
    std::span<const Cell> row(int y) const;
    std::string line_text(int y) const;
    std::vector<std::string> lines() const;

    bool is_dirty(int x, int y) const;
    bool fully_dirty() const { return fully_dirty_; }
    size_t dirty_count() const;
    void mark_clean();

private:
    Cell& at(int x, int y) { return cells_[static_cast<size_t>(y) * width_ + x]; }
    const Cell& at(int x, int y) const { return cells_[static_cast<size_t>(y) * width_ + x]; }
    void mark_dirty(int x, int y);

    int width_;
    int height_;
    std::vector<Cell> cells_;
    std::vector<bool> dirty_;
    bool fully_dirty_ = true;
};

} // namespace cellflow::paint
