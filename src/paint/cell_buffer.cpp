#include <cellflow/paint/cell_buffer.h>
#include <cellflow/core/text.h>
#include <algorithm>

namespace cellflow::paint {

CellBuffer::CellBuffer(int width, int height)
    : width_(std::max(1, width)),
      height_(std::max(1, height)),
      cells_(static_cast<size_t>(width_) * height_),
      dirty_(static_cast<size_t>(width_) * height_, false) {}

const Cell* CellBuffer::cell(int x, int y) const {
    if (!in_bounds(x, y)) return nullptr;
    return &at(x, y);
}

bool CellBuffer::set_cell(int x, int y, const Cell& cell) {
    if (!in_bounds(x, y)) return false;
    Cell& current = at(x, y);
    if (cell.depth < current.depth) return false;

    bool changed = !current.same_appearance(cell);
    current = cell;
    if (changed) mark_dirty(x, y);
    return true;
}

int CellBuffer::write_text(int x, int y, std::string_view text, const CellStyle& style,
                           const std::optional<layout::Rect>& clip) {
    int written = 0;
    int cx = x;
    for (auto& glyph : core::split_glyphs(text)) {
        if (in_bounds(cx, y) && (!clip || clip->contains(cx, y))) {
            Cell c;
            c.ch = glyph;
            c.foreground = style.foreground;
            // Text without its own background keeps the one painted below.
            c.background = style.background.empty() ? at(cx, y).background : style.background;
            c.layer_id = style.layer_id;
            c.node_id = style.node_id;
            c.depth = style.depth;
            if (set_cell(cx, y, c)) ++written;
        }
        ++cx;
    }
    return written;
}

void CellBuffer::fill_region(const layout::Rect& region, const Cell& cell) {
    layout::Rect r = region.intersect(rect());
    for (int y = r.y; y < r.bottom(); ++y) {
        for (int x = r.x; x < r.right(); ++x) {
            set_cell(x, y, cell);
        }
    }
}

void CellBuffer::clear_region(const layout::Rect& region) {
    layout::Rect r = region.intersect(rect());
    for (int y = r.y; y < r.bottom(); ++y) {
        for (int x = r.x; x < r.right(); ++x) {
            at(x, y) = Cell{};
            mark_dirty(x, y);
        }
    }
}

void CellBuffer::clear() {
    std::fill(cells_.begin(), cells_.end(), Cell{});
    std::fill(dirty_.begin(), dirty_.end(), false);
    fully_dirty_ = true;
}

void CellBuffer::resize(int width, int height) {
    width = std::max(1, width);
    height = std::max(1, height);
    if (width == width_ && height == height_) return;

    std::vector<Cell> resized(static_cast<size_t>(width) * height);
    int copy_w = std::min(width, width_);
    int copy_h = std::min(height, height_);
    for (int y = 0; y < copy_h; ++y) {
        for (int x = 0; x < copy_w; ++x) {
            resized[static_cast<size_t>(y) * width + x] = at(x, y);
        }
    }

    width_ = width;
    height_ = height;
    cells_ = std::move(resized);
    dirty_.assign(cells_.size(), false);
    fully_dirty_ = true;
}

std::span<const Cell> CellBuffer::row(int y) const {
    if (y < 0 || y >= height_) return {};
    return std::span<const Cell>(cells_.data() + static_cast<size_t>(y) * width_,
                                 static_cast<size_t>(width_));
}

std::string CellBuffer::line_text(int y) const {
    std::string line;
    for (const auto& c : row(y)) {
        line += c.ch;
    }
    return line;
}

std::vector<std::string> CellBuffer::lines() const {
    std::vector<std::string> result;
    result.reserve(height_);
    for (int y = 0; y < height_; ++y) {
        result.push_back(line_text(y));
    }
    return result;
}

bool CellBuffer::is_dirty(int x, int y) const {
    if (!in_bounds(x, y)) return false;
    return fully_dirty_ || dirty_[static_cast<size_t>(y) * width_ + x];
}

size_t CellBuffer::dirty_count() const {
    if (fully_dirty_) return cells_.size();
    return static_cast<size_t>(std::count(dirty_.begin(), dirty_.end(), true));
}

void CellBuffer::mark_clean() {
    std::fill(dirty_.begin(), dirty_.end(), false);
    fully_dirty_ = false;
}

void CellBuffer::mark_dirty(int x, int y) {
    dirty_[static_cast<size_t>(y) * width_ + x] = true;
}

} // namespace cellflow::paint
