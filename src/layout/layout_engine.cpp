#include <cellflow/layout/layout_engine.h>
#include <cellflow/layout/grid.h>
#include <cellflow/tree/scroll_view.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <unordered_map>

namespace cellflow::layout {

using style::Display;
using tree::Node;
using tree::NodeType;

namespace {

int clamp_size(int value, std::optional<int> min, std::optional<int> max,
               std::optional<int> limit) {
    if (max) value = std::min(value, *max);
    if (min) value = std::max(value, *min);
    if (limit) value = std::min(value, *limit);
    return std::max(0, value);
}

std::optional<int> shrink_by(std::optional<int> value, int amount) {
    if (!value) return std::nullopt;
    return std::max(0, *value - amount);
}

std::optional<int> tighter(std::optional<int> a, std::optional<int> b) {
    if (!a) return b;
    if (!b) return a;
    return std::min(*a, *b);
}

// Leaves size from their own content; everything else from children.
bool is_leaf(const Node& node) {
    NodeType type = node.node_type();
    if (type == NodeType::ScrollView) return false;
    if (type == NodeType::Text || tree::is_interactive(type)) return true;
    return node.children().empty() && node.content().has_value();
}

bool in_flow(const Node& child) {
    const auto& cs = child.computed_style();
    return cs.display != Display::None && !cs.is_out_of_flow();
}

std::optional<int> resolve_offset(const std::optional<style::Dimension>& offset,
                                  std::optional<int> reference,
                                  const style::ViewportSize& viewport) {
    if (!offset) return std::nullopt;
    return offset->resolve(reference, viewport);
}

class MeasureScope {
public:
    MeasureScope(int& depth, bool active) : depth_(depth), active_(active) {
        if (active_) ++depth_;
    }
    ~MeasureScope() {
        if (active_) --depth_;
    }

    MeasureScope(const MeasureScope&) = delete;
    MeasureScope& operator=(const MeasureScope&) = delete;

private:
    int& depth_;
    bool active_;
};

} // namespace

Size content_extent(const std::vector<ChildLayout>& layouts) {
    Size extent;
    for (const auto& cl : layouts) {
        const auto& cs = cl.node->computed_style();
        if (cs.is_out_of_flow()) continue;
        extent.width = std::max(extent.width, cl.bounds.right() + cs.margin.right);
        extent.height = std::max(extent.height, cl.bounds.bottom() + cs.margin.bottom);
    }
    return extent;
}

// ---------------------------------------------------------------------------
// Own size
// ---------------------------------------------------------------------------

Dimensions LayoutEngine::compute_layout(Node& node, const LayoutConstraints& constraints,
                                        const SizeRequest& request) {
    MeasureScope scope(measure_depth_, request.measure_only);
    const auto& cs = node.computed_style();
    auto border = cs.border();
    int frame_w = border.horizontal() + cs.padding.horizontal();
    int frame_h = border.vertical() + cs.padding.vertical();

    auto min_w = resolve_width(cs.min_width, constraints);
    auto max_w = resolve_width(cs.max_width, constraints);
    auto min_h = resolve_height(cs.min_height, constraints);
    auto max_h = resolve_height(cs.max_height, constraints);
    bool leaf = is_leaf(node);

    // Explicit sizes are not limited by the constraints; auto sizes are.
    std::optional<int> width = request.exact_width;
    if (!width) {
        if (auto w = resolve_width(cs.width, constraints)) {
            width = clamp_size(*w, min_w, max_w, std::nullopt);
        } else if (request.width_mode == WidthMode::Fill && constraints.available_width && !leaf) {
            width = clamp_size(*constraints.available_width, min_w, max_w, constraints.max_width);
        }
    }
    std::optional<int> height = request.exact_height;
    if (!height) {
        if (auto h = resolve_height(cs.height, constraints)) {
            height = clamp_size(*h, min_h, max_h, std::nullopt);
        }
    }

    LayoutConstraints inner;
    if (width) {
        inner.max_width = inner.available_width = std::max(0, *width - frame_w);
    } else {
        inner.max_width = shrink_by(tighter(constraints.max_width, max_w), frame_w);
    }
    if (height) {
        inner.max_height = inner.available_height = std::max(0, *height - frame_h);
    } else {
        inner.max_height = shrink_by(tighter(constraints.max_height, max_h), frame_h);
    }

    Size content;
    if (node.node_type() == NodeType::ScrollView) {
        std::vector<ChildLayout> layouts;
        content = layout_scroll_view(static_cast<tree::ScrollViewNode&>(node), inner,
                                     max_w, max_h, layouts);
    } else if (leaf) {
        content = node.measure_content(inner.max_width).value_or(Size{});
        node.set_child_layouts({});
    } else {
        layout_children(node, inner, content);
    }

    int final_w = width ? *width
                        : clamp_size(content.width + frame_w, min_w, max_w, constraints.max_width);
    int final_h = height ? *height
                         : clamp_size(content.height + frame_h, min_h, max_h, constraints.max_height);

    Dimensions dims{final_w, final_h, std::max(0, final_w - frame_w), std::max(0, final_h - frame_h)};
    node.set_dimensions(dims);
    return dims;
}

std::vector<ChildLayout> LayoutEngine::layout(Node& node, const LayoutConstraints& constraints) {
    Size extent;
    return layout_children(node, constraints, extent);
}

std::vector<ChildLayout> LayoutEngine::layout_children(Node& node,
                                                       const LayoutConstraints& constraints,
                                                       Size& extent) {
    for (auto& child : node.children()) {
        if (child->computed_style().display == Display::None) {
            child->set_bounds({});
            child->set_dimensions({});
            child->set_child_layouts({});
        }
    }

    std::vector<ChildLayout> layouts;
    switch (node.computed_style().display) {
        case Display::Flex:
            layouts = layout_flex(node, constraints);
            break;
        case Display::Grid:
            layouts = layout_grid(node, constraints);
            break;
        case Display::Block:
        case Display::None:
            layouts = layout_block(node, constraints);
            break;
    }

    extent = content_extent(layouts);
    apply_relative_offsets(layouts, constraints);
    layout_out_of_flow(node, constraints, extent, layouts);

    // Back to document order; flex `order` only affects placement.
    std::unordered_map<const Node*, size_t> index;
    for (size_t i = 0; i < node.children().size(); ++i) {
        index[node.children()[i].get()] = i;
    }
    std::stable_sort(layouts.begin(), layouts.end(),
        [&index](const ChildLayout& a, const ChildLayout& b) {
            return index[a.node] < index[b.node];
        });

    for (auto& cl : layouts) {
        cl.node->set_bounds(cl.bounds);
    }
    node.set_child_layouts(layouts);
    return layouts;
}

// ---------------------------------------------------------------------------
// Failure boundary
// ---------------------------------------------------------------------------

std::optional<Dimensions> LayoutEngine::layout_child(Node& child,
                                                     const LayoutConstraints& constraints,
                                                     const SizeRequest& request, int x, int y) {
    try {
        return compute_layout(child, constraints, request);
    } catch (const std::exception& e) {
        report_failure(child, constraints, x, y, e.what());
        return std::nullopt;
    }
}

void LayoutEngine::report_failure(Node& child, const LayoutConstraints& constraints,
                                  int x, int y, const std::string& message) {
    // Measured-then-placed items can fail twice in one pass; report once.
    bool already_failed = child.layout_failed();
    child.set_layout_failed(true);
    child.set_bounds({x, y, 0, 0});
    child.set_dimensions({});
    child.set_child_layouts({});
    if (already_failed) return;

    if (diagnostics_) {
        diagnostics_->error("layout", "compute",
                            std::string(tree::node_type_name(child.node_type())) + " at (" +
                            std::to_string(x) + "," + std::to_string(y) + ") " +
                            to_string(constraints) + ": " + message);
    }
    if (error_handler_) {
        LayoutError error;
        error.node_type = child.node_type();
        error.x = x;
        error.y = y;
        error.constraints = constraints;
        error.message = message;
        error_handler_(error);
    }
}

// ---------------------------------------------------------------------------
// Block layout
// ---------------------------------------------------------------------------

std::vector<ChildLayout> LayoutEngine::layout_block(Node& node,
                                                    const LayoutConstraints& constraints) {
    std::vector<ChildLayout> layouts;
    int y = 0;
    std::optional<int> prev_margin_bottom;

    for (auto& child_ptr : node.children()) {
        Node& child = *child_ptr;
        if (!in_flow(child)) continue;
        auto m = child.computed_style().margin;

        // Adjacent vertical margins collapse to the larger of the two.
        int top = y + (prev_margin_bottom ? std::max(*prev_margin_bottom, m.top) : m.top);

        LayoutConstraints cc;
        cc.max_width = shrink_by(constraints.max_width, m.horizontal());
        cc.available_width = shrink_by(constraints.available_width, m.horizontal());
        // Earlier siblings do not shrink the limit; overflow is clipped at paint.
        cc.max_height = constraints.max_height;
        cc.available_height = constraints.available_height;

        auto dims = layout_child(child, cc, {}, m.left, top);
        if (!dims) continue;

        int w = std::max(1, dims->width);
        int h = std::max(1, dims->height);
        layouts.push_back({&child, {m.left, top, w, h}});
        y = top + h;
        prev_margin_bottom = m.bottom;
    }
    return layouts;
}

// ---------------------------------------------------------------------------
// Flex layout
// ---------------------------------------------------------------------------

std::vector<ChildLayout> LayoutEngine::layout_flex(Node& node,
                                                   const LayoutConstraints& constraints) {
    const auto& cs = node.computed_style();
    bool is_row = cs.is_row();

    // Row: the main gap is column-gap. Column: the main gap is row-gap.
    int main_gap = is_row ? cs.column_gap : cs.row_gap;
    int cross_gap = is_row ? cs.row_gap : cs.column_gap;

    // The main size is definite for rows with a known width and for
    // columns with an explicit height. Without it there is no free space
    // to distribute, only overflow against the limit to shrink.
    std::optional<int> main_size = is_row ? constraints.available_width
                                          : constraints.available_height;
    std::optional<int> main_limit = is_row ? constraints.max_width : constraints.max_height;
    std::optional<int> cross_size = is_row ? constraints.available_height
                                           : constraints.available_width;

    struct FlexItem {
        Node* node = nullptr;
        LayoutConstraints constraints;
        int main = 0;
        int cross = 0;
        int margin_main_start = 0;
        int margin_main_end = 0;
        int margin_cross_start = 0;
        int margin_cross_end = 0;
        float grow = 0;
        float shrink = 1;
        int order = 0;
        int main_pos = 0;
        int cross_pos = 0;

        int outer_main() const { return main + margin_main_start + margin_main_end; }
        int outer_cross() const { return cross + margin_cross_start + margin_cross_end; }
    };

    // Step 1: measure every item at its intrinsic or explicit size.
    std::vector<FlexItem> items;
    for (auto& child_ptr : node.children()) {
        Node& child = *child_ptr;
        if (!in_flow(child)) continue;
        const auto& child_cs = child.computed_style();
        auto m = child_cs.margin;

        FlexItem item;
        item.node = &child;
        item.margin_main_start = is_row ? m.left : m.top;
        item.margin_main_end = is_row ? m.right : m.bottom;
        item.margin_cross_start = is_row ? m.top : m.left;
        item.margin_cross_end = is_row ? m.bottom : m.right;
        item.grow = child_cs.flex_grow;
        item.shrink = child_cs.flex_shrink;
        item.order = child_cs.order;

        // Items shrink to fit; available sizes only serve as percentage
        // references here.
        item.constraints.max_width = shrink_by(constraints.max_width, m.horizontal());
        item.constraints.available_width = is_row
            ? constraints.available_width
            : shrink_by(constraints.available_width, m.horizontal());
        item.constraints.max_height = shrink_by(constraints.max_height, m.vertical());
        item.constraints.available_height = constraints.available_height;

        SizeRequest request;
        request.width_mode = WidthMode::FitContent;
        request.measure_only = true;
        if (child_cs.flex_basis) {
            if (auto basis = child_cs.flex_basis->resolve(main_size, viewport_)) {
                if (is_row) request.exact_width = *basis;
                else request.exact_height = *basis;
            }
        }

        auto dims = layout_child(child, item.constraints, request, m.left, m.top);
        if (!dims) continue;
        item.main = std::max(1, is_row ? dims->width : dims->height);
        item.cross = std::max(1, is_row ? dims->height : dims->width);
        items.push_back(item);
    }
    if (items.empty()) return {};

    // Sort by order; equal values keep document order.
    std::stable_sort(items.begin(), items.end(),
        [](const FlexItem& a, const FlexItem& b) { return a.order < b.order; });
    if (cs.is_reverse()) {
        std::reverse(items.begin(), items.end());
    }

    // Step 2: break into lines using the measured main sizes.
    bool wrap = cs.flex_wrap != style::FlexWrap::NoWrap;
    std::optional<int> line_capacity = main_size ? main_size : main_limit;

    struct FlexLine {
        std::vector<FlexItem*> items;
        int cross = 0;
        int cross_pos = 0;
    };
    std::vector<FlexLine> lines(1);
    int used = 0;
    for (auto& item : items) {
        FlexLine& line = lines.back();
        if (wrap && line_capacity && !line.items.empty() &&
            used + main_gap + item.outer_main() > *line_capacity) {
            lines.emplace_back();
            used = 0;
        }
        FlexLine& target = lines.back();
        used = target.items.empty() ? item.outer_main() : used + main_gap + item.outer_main();
        target.items.push_back(&item);
    }

    // Step 3: grow and shrink, single-line containers only.
    if (!wrap) {
        int total = main_gap * (static_cast<int>(items.size()) - 1);
        for (auto& item : items) total += item.outer_main();

        int free = 0;
        if (main_size) {
            free = *main_size - total;
        } else if (main_limit && total > *main_limit) {
            free = *main_limit - total;
        }

        if (free > 0) {
            float total_grow = 0;
            for (auto& item : items) total_grow += item.grow;
            if (total_grow > 0) {
                for (auto& item : items) {
                    item.main += static_cast<int>(std::floor(free * item.grow / total_grow));
                }
            }
        } else if (free < 0) {
            float total_scaled = 0;
            for (auto& item : items) total_scaled += item.shrink * item.main;
            if (total_scaled > 0) {
                for (auto& item : items) {
                    float share = -free * item.shrink * item.main / total_scaled;
                    item.main = std::max(1, item.main - static_cast<int>(std::ceil(share)));
                }
            }
        }
    }

    // Step 4: line cross sizes. A single unwrapped line takes the
    // container's definite cross size.
    for (auto& line : lines) {
        for (auto* item : line.items) {
            line.cross = std::max(line.cross, item->outer_cross());
        }
    }
    if (!wrap && cross_size) {
        lines.front().cross = *cross_size;
    }

    // Step 5: align-content distributes the free cross space over lines.
    int line_count = static_cast<int>(lines.size());
    int lines_total = cross_gap * (line_count - 1);
    for (auto& line : lines) lines_total += line.cross;
    int cross_free = cross_size ? *cross_size - lines_total : 0;

    if (cs.align_content == style::AlignContent::Stretch && cross_free > 0) {
        int extra = cross_free / line_count;
        for (auto& line : lines) line.cross += extra;
        cross_free = 0;
    }
    if (cs.flex_wrap == style::FlexWrap::WrapReverse) {
        std::reverse(lines.begin(), lines.end());
    }

    int acc = 0;
    for (int i = 0; i < line_count; ++i) {
        double offset = 0;
        switch (cs.align_content) {
            case style::AlignContent::FlexStart:
            case style::AlignContent::Stretch:
                break;
            case style::AlignContent::FlexEnd:
                offset = cross_free;
                break;
            case style::AlignContent::Center:
                offset = std::floor(cross_free / 2.0);
                break;
            case style::AlignContent::SpaceBetween:
                if (line_count > 1 && cross_free > 0) {
                    offset = static_cast<double>(cross_free) / (line_count - 1) * i;
                }
                break;
            case style::AlignContent::SpaceAround:
                if (cross_free > 0) {
                    offset = static_cast<double>(cross_free) / line_count * (i + 0.5);
                }
                break;
        }
        lines[i].cross_pos = acc + static_cast<int>(std::floor(offset));
        acc += lines[i].cross + cross_gap;
    }

    // Step 6: justify-content along the main axis, align-items across.
    for (auto& line : lines) {
        int count = static_cast<int>(line.items.size());
        int line_used = main_gap * (count - 1);
        for (auto* item : line.items) line_used += item->outer_main();
        int free = main_size ? *main_size - line_used : 0;
        int spare = std::max(0, free);

        double start = 0;
        double between = 0;
        switch (cs.justify_content) {
            case style::JustifyContent::FlexStart:
                break;
            case style::JustifyContent::FlexEnd:
                start = free;
                break;
            case style::JustifyContent::Center:
                start = std::floor(free / 2.0);
                break;
            case style::JustifyContent::SpaceBetween:
                between = count > 1 ? static_cast<double>(spare) / (count - 1) : 0;
                break;
            case style::JustifyContent::SpaceAround:
                between = static_cast<double>(spare) / count;
                start = between / 2;
                break;
            case style::JustifyContent::SpaceEvenly:
                between = static_cast<double>(spare) / (count + 1);
                start = between;
                break;
        }

        double pos = start;
        for (auto* item : line.items) {
            item->main_pos = static_cast<int>(std::floor(pos)) + item->margin_main_start;
            pos += item->outer_main() + main_gap + between;

            const auto& child_cs = item->node->computed_style();
            style::AlignItems align = cs.align_items;
            switch (child_cs.align_self) {
                case style::AlignSelf::Auto: break;
                case style::AlignSelf::FlexStart: align = style::AlignItems::FlexStart; break;
                case style::AlignSelf::FlexEnd: align = style::AlignItems::FlexEnd; break;
                case style::AlignSelf::Center: align = style::AlignItems::Center; break;
                case style::AlignSelf::Stretch: align = style::AlignItems::Stretch; break;
            }

            int room = line.cross - item->margin_cross_start - item->margin_cross_end;
            int offset = 0;
            switch (align) {
                case style::AlignItems::FlexStart:
                    break;
                case style::AlignItems::FlexEnd:
                    offset = room - item->cross;
                    break;
                case style::AlignItems::Center:
                    offset = static_cast<int>(std::floor((room - item->cross) / 2.0));
                    break;
                case style::AlignItems::Stretch:
                    item->cross = std::max(1, room);
                    break;
            }
            item->cross_pos = line.cross_pos + item->margin_cross_start + offset;
        }
    }

    // Step 7: lay every item out again at its final size.
    std::vector<ChildLayout> layouts;
    for (auto& item : items) {
        int x = is_row ? item.main_pos : item.cross_pos;
        int y = is_row ? item.cross_pos : item.main_pos;
        int w = is_row ? item.main : item.cross;
        int h = is_row ? item.cross : item.main;

        SizeRequest request;
        request.width_mode = WidthMode::FitContent;
        request.exact_width = w;
        request.exact_height = h;
        if (!layout_child(*item.node, item.constraints, request, x, y)) continue;
        layouts.push_back({item.node, {x, y, w, h}});
    }
    return layouts;
}

// ---------------------------------------------------------------------------
// Grid layout
// ---------------------------------------------------------------------------

std::vector<ChildLayout> LayoutEngine::layout_grid(Node& node,
                                                   const LayoutConstraints& constraints) {
    const auto& cs = node.computed_style();

    std::vector<Node*> children;
    for (auto& child : node.children()) {
        if (in_flow(*child)) children.push_back(child.get());
    }
    if (children.empty()) return {};
    int item_count = static_cast<int>(children.size());

    // Measurement passes lay the grid out again later; warn from the final one.
    auto report_template = [this](const char* property, const style::GridTemplate& tmpl) {
        if (diagnostics_ && measure_depth_ == 0) {
            diagnostics_->warning("layout", "grid",
                                  std::string(core::error_kind_name(core::ErrorKind::MalformedStyle)) +
                                  ": unparseable " + property + " '" + tmpl.tokens +
                                  "', using equal tracks");
        }
    };
    auto report_placement = [this](const char* property, const std::string& text) {
        if (diagnostics_ && measure_depth_ == 0) {
            diagnostics_->warning("layout", "grid",
                                  std::string(core::error_kind_name(core::ErrorKind::MalformedStyle)) +
                                  ": " + property + " '" + text + "' out of range, clamped to " +
                                  std::to_string(core::config::kMaxGridLine));
        }
    };

    GridTrackList columns = parse_grid_template(cs.grid_template_columns);
    if (!columns.valid) report_template("gridTemplateColumns", cs.grid_template_columns);
    if (columns.tracks.empty()) {
        int count = std::min(item_count, core::config::kMaxAutoGridColumns);
        columns.tracks.assign(static_cast<size_t>(count), GridTrack::fraction(1));
    }
    GridTrackList rows = parse_grid_template(cs.grid_template_rows);
    if (!rows.valid) report_template("gridTemplateRows", cs.grid_template_rows);

    const int column_count = static_cast<int>(columns.tracks.size());
    const int explicit_rows = static_cast<int>(rows.tracks.size());
    const bool column_flow = cs.grid_auto_flow.column;
    const bool dense = cs.grid_auto_flow.dense;

    // --- Placement ---------------------------------------------------------
    struct GridItem {
        Node* node = nullptr;
        int row = 0;
        int column = 0;
        int row_span = 1;
        int column_span = 1;
    };

    int row_count = column_flow
        ? std::max(explicit_rows, (item_count + column_count - 1) / column_count)
        : explicit_rows;
    std::vector<std::vector<bool>> occupied;
    auto ensure_rows = [&](int count) {
        while (static_cast<int>(occupied.size()) < count) {
            occupied.emplace_back(static_cast<size_t>(column_count), false);
        }
    };
    auto is_free = [&](int r, int c, int rs, int span) {
        if (c < 0 || c + span > column_count) return false;
        ensure_rows(r + rs);
        for (int rr = r; rr < r + rs; ++rr) {
            for (int cc = c; cc < c + span; ++cc) {
                if (occupied[rr][cc]) return false;
            }
        }
        return true;
    };
    auto occupy = [&](const GridItem& item) {
        ensure_rows(item.row + item.row_span);
        for (int rr = item.row; rr < item.row + item.row_span; ++rr) {
            for (int cc = item.column; cc < item.column + item.column_span; ++cc) {
                occupied[rr][cc] = true;
            }
        }
    };

    int cursor_row = 0;
    int cursor_column = 0;
    std::vector<GridItem> items;
    for (Node* child : children) {
        const auto& child_cs = child->computed_style();
        GridSpan row_span;
        GridSpan column_span;
        if (!child_cs.grid_area.empty()) {
            parse_grid_area(child_cs.grid_area, rows, columns, row_span, column_span);
            if (row_span.clamped || column_span.clamped) {
                report_placement("gridArea", child_cs.grid_area);
            }
        } else {
            if (!child_cs.grid_column.empty()) {
                column_span = parse_grid_span(child_cs.grid_column, columns);
                if (column_span.clamped) report_placement("gridColumn", child_cs.grid_column);
            }
            if (!child_cs.grid_row.empty()) {
                row_span = parse_grid_span(child_cs.grid_row, rows);
                if (row_span.clamped) report_placement("gridRow", child_cs.grid_row);
            }
        }

        // Columns are clamped into the explicit grid; rows may extend it.
        GridItem item;
        item.node = child;
        item.column_span = std::clamp(column_span.span, 1, column_count);
        item.row_span = std::max(1, row_span.span);
        std::optional<int> fixed_column;
        if (column_span.start) {
            fixed_column = std::clamp(*column_span.start, 0, column_count - 1);
            item.column_span = std::min(item.column_span, column_count - *fixed_column);
        }
        std::optional<int> fixed_row;
        if (row_span.start) {
            fixed_row = std::max(0, *row_span.start);
            if (column_flow) {
                fixed_row = std::min(*fixed_row, std::max(0, row_count - 1));
                item.row_span = std::min(item.row_span, std::max(1, row_count - *fixed_row));
            }
        }

        if (fixed_row && fixed_column) {
            item.row = *fixed_row;
            item.column = *fixed_column;
        } else if (fixed_row) {
            item.row = *fixed_row;
            item.column = 0;
            for (int c = 0; c + item.column_span <= column_count; ++c) {
                if (is_free(item.row, c, item.row_span, item.column_span)) {
                    item.column = c;
                    break;
                }
            }
        } else if (fixed_column) {
            item.column = *fixed_column;
            int r = dense ? 0 : cursor_row;
            if (!column_flow && !dense && item.column < cursor_column) ++r;
            while (!is_free(r, item.column, item.row_span, item.column_span)) ++r;
            item.row = r;
            if (column_flow) row_count = std::max(row_count, r + item.row_span);
        } else if (!column_flow) {
            int r = dense ? 0 : cursor_row;
            int c = dense ? 0 : cursor_column;
            while (true) {
                if (c + item.column_span > column_count) {
                    ++r;
                    c = 0;
                    continue;
                }
                if (is_free(r, c, item.row_span, item.column_span)) break;
                ++c;
            }
            item.row = r;
            item.column = c;
        } else {
            // Column-major within the row count; grow it when nothing fits.
            int start_c = dense ? 0 : cursor_column;
            int start_r = dense ? 0 : cursor_row;
            bool placed = false;
            while (!placed) {
                for (int c = start_c; c + item.column_span <= column_count && !placed; ++c) {
                    for (int r = (c == start_c ? start_r : 0); r + item.row_span <= row_count; ++r) {
                        if (is_free(r, c, item.row_span, item.column_span)) {
                            item.row = r;
                            item.column = c;
                            placed = true;
                            break;
                        }
                    }
                }
                if (!placed) {
                    ++row_count;
                    start_c = 0;
                    start_r = 0;
                }
            }
        }

        occupy(item);
        if (!dense) {
            if (column_flow) {
                cursor_column = item.column;
                cursor_row = item.row + item.row_span;
            } else {
                cursor_row = item.row;
                cursor_column = item.column + item.column_span;
            }
        }
        items.push_back(item);
    }

    int total_rows = std::max(explicit_rows, row_count);
    for (auto& item : items) total_rows = std::max(total_rows, item.row + item.row_span);

    // --- Track sizing ------------------------------------------------------
    std::optional<int> grid_width = constraints.available_width ? constraints.available_width
                                                                : constraints.max_width;
    std::vector<int> column_sizes =
        size_grid_tracks(columns.tracks, grid_width.value_or(0), cs.column_gap);

    auto span_size = [](const std::vector<int>& sizes, int start, int span, int gap) {
        int total = gap * (span - 1);
        for (int i = start; i < start + span; ++i) total += sizes[i];
        return total;
    };

    // Without a width, fraction columns size to their widest single-column item.
    if (!grid_width) {
        for (auto& item : items) {
            if (item.column_span != 1 || !columns.tracks[item.column].is_fraction()) continue;
            SizeRequest request;
            request.width_mode = WidthMode::FitContent;
            request.measure_only = true;
            auto dims = layout_child(*item.node, {}, request, 0, 0);
            if (!dims) continue;
            auto m = item.node->computed_style().margin;
            column_sizes[item.column] = std::max(column_sizes[item.column],
                                                 dims->width + m.horizontal());
        }
    }

    // Rows: fixed tracks keep their size; fraction tracks share a definite
    // height; everything else (implicit rows included) sizes to content.
    std::vector<int> row_sizes(static_cast<size_t>(total_rows), 0);
    std::vector<bool> content_row(static_cast<size_t>(total_rows), true);
    if (explicit_rows > 0) {
        std::vector<int> sized = size_grid_tracks(rows.tracks, constraints.available_height.value_or(0),
                                                  cs.row_gap);
        for (int r = 0; r < explicit_rows; ++r) {
            const auto& track = rows.tracks[r];
            if (!track.is_fraction() || constraints.available_height) {
                row_sizes[r] = sized[r];
                content_row[r] = false;
            }
        }
    }

    for (auto& item : items) {
        bool any_content = false;
        for (int r = item.row; r < item.row + item.row_span; ++r) {
            if (content_row[r]) any_content = true;
        }
        if (!any_content || item.node->layout_failed()) continue;

        auto m = item.node->computed_style().margin;
        int w = std::max(0, span_size(column_sizes, item.column, item.column_span, cs.column_gap) -
                                m.horizontal());
        LayoutConstraints cc;
        cc.max_width = cc.available_width = w;
        cc.max_height = constraints.max_height;
        SizeRequest request;
        request.exact_width = w;
        request.measure_only = true;
        auto dims = layout_child(*item.node, cc, request, 0, 0);
        if (!dims) continue;

        int needed = dims->height + m.vertical();
        int have = span_size(row_sizes, item.row, item.row_span, cs.row_gap);
        if (needed > have) {
            int last = item.row + item.row_span - 1;
            while (last > item.row && !content_row[last]) --last;
            if (content_row[last]) row_sizes[last] += needed - have;
        }
    }

    std::vector<int> column_pos(column_sizes.size(), 0);
    for (size_t i = 1; i < column_pos.size(); ++i) {
        column_pos[i] = column_pos[i - 1] + column_sizes[i - 1] + cs.column_gap;
    }
    std::vector<int> row_pos(row_sizes.size(), 0);
    for (size_t i = 1; i < row_pos.size(); ++i) {
        row_pos[i] = row_pos[i - 1] + row_sizes[i - 1] + cs.row_gap;
    }

    // --- Final layout --------------------------------------------------------
    std::vector<ChildLayout> layouts;
    for (auto& item : items) {
        auto m = item.node->computed_style().margin;
        int x = column_pos[item.column] + m.left;
        int y = row_pos[item.row] + m.top;
        int w = std::max(0, span_size(column_sizes, item.column, item.column_span, cs.column_gap) -
                                m.horizontal());
        int h = std::max(0, span_size(row_sizes, item.row, item.row_span, cs.row_gap) -
                                m.vertical());

        LayoutConstraints cc = LayoutConstraints::bounded(w, h);
        SizeRequest request;
        request.exact_width = w;
        request.exact_height = h;
        if (!layout_child(*item.node, cc, request, x, y)) continue;
        layouts.push_back({item.node, {x, y, w, h}});
    }
    return layouts;
}

// ---------------------------------------------------------------------------
// Positioning
// ---------------------------------------------------------------------------

void LayoutEngine::apply_relative_offsets(std::vector<ChildLayout>& layouts,
                                          const LayoutConstraints& constraints) const {
    for (auto& cl : layouts) {
        const auto& cs = cl.node->computed_style();
        if (cs.position != style::Position::Relative) continue;

        int dx = 0;
        if (auto left = resolve_offset(cs.left, constraints.available_width, viewport_)) {
            dx = *left;
        } else if (auto right = resolve_offset(cs.right, constraints.available_width, viewport_)) {
            dx = -*right;
        }
        int dy = 0;
        if (auto top = resolve_offset(cs.top, constraints.available_height, viewport_)) {
            dy = *top;
        } else if (auto bottom = resolve_offset(cs.bottom, constraints.available_height, viewport_)) {
            dy = -*bottom;
        }
        cl.bounds = cl.bounds.translated(dx, dy);
    }
}

void LayoutEngine::layout_out_of_flow(Node& node, const LayoutConstraints& constraints,
                                      const Size& extent, std::vector<ChildLayout>& layouts) {
    for (auto& child_ptr : node.children()) {
        Node& child = *child_ptr;
        const auto& cs = child.computed_style();
        if (cs.display == Display::None || !cs.is_out_of_flow()) continue;

        // Fixed boxes are placed against the whole viewport, absolute ones
        // against the content box of their parent.
        bool fixed = cs.position == style::Position::Fixed;
        int box_w = fixed ? viewport_.width : constraints.available_width.value_or(extent.width);
        int box_h = fixed ? viewport_.height : constraints.available_height.value_or(extent.height);

        LayoutConstraints cc;
        cc.max_width = fixed ? std::optional<int>(box_w) : constraints.max_width;
        cc.available_width = box_w;
        cc.max_height = fixed ? std::optional<int>(box_h) : constraints.max_height;
        cc.available_height = box_h;

        auto m = cs.margin;
        auto left = resolve_offset(cs.left, box_w, viewport_);
        auto right = resolve_offset(cs.right, box_w, viewport_);
        auto top = resolve_offset(cs.top, box_h, viewport_);
        auto bottom = resolve_offset(cs.bottom, box_h, viewport_);

        SizeRequest request;
        request.width_mode = WidthMode::FitContent;
        auto dims = layout_child(child, cc, request, left.value_or(0), top.value_or(0));
        if (!dims) continue;

        int x = m.left;
        if (left) x = *left + m.left;
        else if (right) x = box_w - *right - dims->width - m.right;
        int y = m.top;
        if (top) y = *top + m.top;
        else if (bottom) y = box_h - *bottom - dims->height - m.bottom;

        layouts.push_back({&child, {x, y, dims->width, dims->height}});
    }
}

// ---------------------------------------------------------------------------
// Scroll views
// ---------------------------------------------------------------------------

Size LayoutEngine::layout_scroll_view(tree::ScrollViewNode& view, const LayoutConstraints& inner,
                                      std::optional<int> max_width, std::optional<int> max_height,
                                      std::vector<ChildLayout>& layouts) {
    bool horizontal = view.horizontal();

    // Children get an unbounded scroll axis. `reserved` cells of the
    // other axis go to the scrollbar.
    auto content_constraints = [&](int reserved) {
        LayoutConstraints c = inner;
        if (horizontal) {
            c.max_width.reset();
            c.available_width.reset();
            c.max_height = shrink_by(inner.max_height, reserved);
            c.available_height = shrink_by(inner.available_height, reserved);
        } else {
            c.max_height.reset();
            c.available_height.reset();
            c.max_width = shrink_by(inner.max_width, reserved);
            c.available_width = shrink_by(inner.available_width, reserved);
        }
        return c;
    };
    auto visible = [](int content, std::optional<int> definite, std::optional<int> limit) {
        if (definite) return *definite;
        return limit ? std::min(content, *limit) : content;
    };

    // Whether the scrollbar column is needed is only known after a first
    // pass; that pass is a measurement unless no scrollbar can be shown.
    Size content;
    int reserved = 0;
    if (view.show_scrollbar()) {
        {
            MeasureScope scope(measure_depth_, true);
            layout_children(view, content_constraints(0), content);
        }
        bool overflow = horizontal
            ? content.width > visible(content.width, inner.available_width, inner.max_width)
            : content.height > visible(content.height, inner.available_height, inner.max_height);
        if (overflow) reserved = 1;
    }
    layouts = layout_children(view, content_constraints(reserved), content);

    Size window;
    if (horizontal) {
        window.width = visible(content.width, inner.available_width, inner.max_width);
        window.height = visible(content.height, shrink_by(inner.available_height, reserved),
                                shrink_by(inner.max_height, reserved));
    } else {
        window.height = visible(content.height, inner.available_height, inner.max_height);
        window.width = visible(content.width, shrink_by(inner.available_width, reserved),
                               shrink_by(inner.max_width, reserved));
    }

    if (measure_depth_ == 0) {
        view.update_layout(window, content, max_width, max_height);
    }
    return horizontal ? Size{window.width, window.height + reserved}
                      : Size{window.width + reserved, window.height};
}

} // namespace cellflow::layout
