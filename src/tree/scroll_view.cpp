#include <cellflow/tree/scroll_view.h>
#include <cellflow/paint/box_painter.h>
#include <cellflow/paint/cell_buffer.h>
#include <cellflow/paint/paint_context.h>
#include <algorithm>
#include <cmath>

namespace cellflow::tree {

namespace config = core::config;

ScrollViewNode::ScrollViewNode() : Node(NodeType::ScrollView) {}

void ScrollViewNode::set_horizontal(bool horizontal) {
    horizontal_ = horizontal;
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
}

void ScrollViewNode::set_show_scrollbar(bool show) {
    show_scrollbar_ = show;
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
}

int ScrollViewNode::max_scroll_top() const {
    return std::max(0, state_.content_height - viewport_height_);
}

int ScrollViewNode::max_scroll_left() const {
    return std::max(0, state_.content_width - viewport_width_);
}

bool ScrollViewNode::is_at_bottom() const {
    return state_.scroll_top >= max_scroll_top() - config::kAutoScrollTolerance;
}

bool ScrollViewNode::scroll_by(int delta_y, int delta_x) {
    return scroll_to(state_.scroll_top + delta_y, state_.scroll_left + delta_x);
}

bool ScrollViewNode::scroll_to(int top, std::optional<int> left) {
    int new_top = std::clamp(top, 0, max_scroll_top());
    int new_left = left ? std::clamp(*left, 0, max_scroll_left()) : state_.scroll_left;
    if (new_top == state_.scroll_top && new_left == state_.scroll_left) {
        return false;
    }
    state_.scroll_top = new_top;
    state_.scroll_left = new_left;
    notify_scroll();
    return true;
}

bool ScrollViewNode::scroll_to_top() {
    return horizontal_ ? scroll_to(state_.scroll_top, 0) : scroll_to(0);
}

bool ScrollViewNode::scroll_to_end() {
    return horizontal_ ? scroll_to(state_.scroll_top, max_scroll_left())
                       : scroll_to(max_scroll_top());
}

bool ScrollViewNode::scroll_to_node(const Node& target) {
    // Offset of `target` inside this node's content box.
    int offset_x = 0;
    int offset_y = 0;
    const Node* n = &target;
    while (n != this) {
        offset_x += n->bounds().x;
        offset_y += n->bounds().y;
        const Node* p = n->parent();
        if (!p) return false;
        if (p != this) {
            auto b = p->border();
            auto pad = p->padding();
            offset_x += b.left + pad.left;
            offset_y += b.top + pad.top;
        }
        n = p;
    }

    if (horizontal_) {
        int width = target.bounds().width;
        if (offset_x < state_.scroll_left) {
            return scroll_to(state_.scroll_top, offset_x);
        }
        if (offset_x + width > state_.scroll_left + viewport_width_) {
            return scroll_to(state_.scroll_top, offset_x + width - viewport_width_);
        }
        return false;
    }

    int height = target.bounds().height;
    if (offset_y < state_.scroll_top) {
        return scroll_to(offset_y);
    }
    if (offset_y + height > state_.scroll_top + viewport_height_) {
        return scroll_to(offset_y + height - viewport_height_);
    }
    return false;
}

bool ScrollViewNode::handle_key(ScrollKey key) {
    int page = std::max(1, (horizontal_ ? viewport_width_ : viewport_height_) - 1);
    auto move = [this](int delta) {
        return horizontal_ ? scroll_by(0, delta) : scroll_by(delta);
    };

    switch (key) {
        case ScrollKey::Up:
        case ScrollKey::Down:
            if (horizontal_) return false;
            move(key == ScrollKey::Up ? -scroll_step_ : scroll_step_);
            return true;
        case ScrollKey::Left:
        case ScrollKey::Right:
            if (!horizontal_) return false;
            move(key == ScrollKey::Left ? -scroll_step_ : scroll_step_);
            return true;
        case ScrollKey::PageUp:
            move(-page);
            return true;
        case ScrollKey::PageDown:
            move(page);
            return true;
        case ScrollKey::Home:
            scroll_to_top();
            return true;
        case ScrollKey::End:
            scroll_to_end();
            return true;
    }
    return false;
}

int ScrollViewNode::scrollbar_extent() const {
    if (!show_scrollbar_) return 0;
    return (horizontal_ ? can_scroll_horizontally() : can_scroll_vertically()) ? 1 : 0;
}

ScrollbarGeometry ScrollViewNode::scrollbar_geometry() const {
    ScrollbarGeometry g;
    int visible = horizontal_ ? viewport_width_ : viewport_height_;
    int content = horizontal_ ? state_.content_width : state_.content_height;
    int max_scroll = horizontal_ ? max_scroll_left() : max_scroll_top();
    int position = horizontal_ ? state_.scroll_left : state_.scroll_top;

    g.track_length = visible;
    if (content <= 0 || visible <= 0) {
        g.thumb_size = visible;
        return g;
    }
    g.thumb_size = static_cast<int>(std::lround(static_cast<double>(visible) * visible / content));
    g.thumb_size = std::clamp(g.thumb_size, 1, std::max(1, visible));
    if (max_scroll > 0) {
        double ratio = static_cast<double>(position) / max_scroll;
        g.thumb_offset = static_cast<int>(std::lround(ratio * (g.track_length - g.thumb_size)));
    }
    return g;
}

layout::Rect ScrollViewNode::scrollbar_track_rect() const {
    layout::Rect inner = content_screen_rect();
    if (horizontal_) {
        return {inner.x, inner.y + viewport_height_, viewport_width_, 1};
    }
    return {inner.x + viewport_width_, inner.y, 1, viewport_height_};
}

bool ScrollViewNode::handle_mouse(const MouseEvent& event) {
    using Action = MouseEvent::Action;
    auto scroll_axis = [this](int delta) {
        return horizontal_ ? scroll_by(0, delta) : scroll_by(delta);
    };

    switch (event.action) {
        case Action::WheelUp:
        case Action::WheelDown:
            if (!screen_rect_.contains(event.x, event.y)) return false;
            scroll_axis(event.action == Action::WheelUp ? -scroll_step_ : scroll_step_);
            return true;

        case Action::Press: {
            if (scrollbar_extent() == 0) return false;
            layout::Rect track = scrollbar_track_rect();
            if (!track.contains(event.x, event.y)) return false;
            int rel = horizontal_ ? event.x - track.x : event.y - track.y;
            auto g = scrollbar_geometry();
            int page = horizontal_ ? viewport_width_ : viewport_height_;
            if (rel < g.thumb_offset) {
                scroll_axis(-page);
            } else if (rel >= g.thumb_offset + g.thumb_size) {
                scroll_axis(page);
            } else {
                dragging_thumb_ = true;
                drag_grab_offset_ = rel - g.thumb_offset;
            }
            return true;
        }

        case Action::Drag: {
            if (!dragging_thumb_) return false;
            layout::Rect track = scrollbar_track_rect();
            int rel = horizontal_ ? event.x - track.x : event.y - track.y;
            auto g = scrollbar_geometry();
            int travel = g.track_length - g.thumb_size;
            if (travel <= 0) return true;
            int thumb_pos = std::clamp(rel - drag_grab_offset_, 0, travel);
            int max_scroll = horizontal_ ? max_scroll_left() : max_scroll_top();
            int target = static_cast<int>(
                std::lround(static_cast<double>(thumb_pos) / travel * max_scroll));
            if (horizontal_) {
                scroll_to(state_.scroll_top, target);
            } else {
                scroll_to(target);
            }
            return true;
        }

        case Action::Release:
            if (!dragging_thumb_) return false;
            dragging_thumb_ = false;
            return true;
    }
    return false;
}

void ScrollViewNode::update_layout(const layout::Size& viewport, const layout::Size& content,
                                   std::optional<int> max_width, std::optional<int> max_height) {
    bool was_at_bottom = is_at_bottom();
    int previous_height = state_.content_height;

    viewport_width_ = std::max(0, viewport.width);
    viewport_height_ = std::max(0, viewport.height);
    state_.content_width = std::max(0, content.width);
    state_.content_height = std::max(0, content.height);
    state_.max_width = max_width;
    state_.max_height = max_height;

    if (auto_scroll_to_bottom_ && was_at_bottom && state_.content_height > previous_height) {
        scroll_to(max_scroll_top());
    } else {
        scroll_to(state_.scroll_top, state_.scroll_left);
    }
}

void ScrollViewNode::notify_scroll() {
    mark_dirty(DirtyFlags::Paint);
    if (on_scroll_) {
        on_scroll_(state_.scroll_top, state_.scroll_left);
    }
}

void ScrollViewNode::paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) {
    paint_box(buffer, ctx);

    layout::Rect inner = content_screen_rect();
    layout::Rect window{inner.x, inner.y, viewport_width_, viewport_height_};
    layout::Rect content{inner.x, inner.y,
                         std::max(state_.content_width, viewport_width_),
                         std::max(state_.content_height, viewport_height_)};

    // The window clips, the content viewport carries the scroll offset.
    paint::Viewport* window_vp = nullptr;
    paint::Viewport* content_vp = nullptr;
    std::unique_ptr<paint::Viewport> local_window;
    std::unique_ptr<paint::Viewport> local_content;
    if (ctx.viewports) {
        window_vp = &ctx.viewports->create_anonymous(window, ctx.viewport);
        content_vp = &ctx.viewports->create_viewport(*this, content, window_vp);
    } else {
        // Unparented so the caller's viewport keeps no pointer to it.
        auto visible = ctx.clip(window);
        local_window = std::make_unique<paint::Viewport>(visible ? *visible : layout::Rect{});
        local_content = std::make_unique<paint::Viewport>(content, local_window.get());
        window_vp = local_window.get();
        content_vp = local_content.get();
    }
    content_vp->set_scroll(state_.scroll_left, state_.scroll_top);

    paint::PaintContext child_ctx = ctx;
    child_ctx.viewport = content_vp;
    for (auto& child : children_) {
        paint_descendants(*child, buffer, child_ctx);
    }

    paint_scrollbar(buffer, ctx);
}

void ScrollViewNode::paint_descendants(Node& node, paint::CellBuffer& buffer,
                                       const paint::PaintContext& ctx) const {
    if (node.layout_failed() || node.computed_style().display == style::Display::None) {
        return;
    }
    if (!ctx.clip(node.screen_rect())) {
        return;
    }
    node.paint(buffer, ctx);
    if (node.paints_descendants()) {
        return;
    }
    for (auto& child : node.children()) {
        paint_descendants(*child, buffer, ctx);
    }
}

void ScrollViewNode::paint_scrollbar(paint::CellBuffer& buffer,
                                     const paint::PaintContext& ctx) const {
    bool overflow = horizontal_ ? can_scroll_horizontally() : can_scroll_vertically();
    if (!overflow || viewport_width_ <= 0 || viewport_height_ <= 0) return;

    paint::CellStyle track_style;
    track_style.foreground = config::kScrollbarTrackColor;
    track_style.layer_id = ctx.layer_id;
    track_style.node_id = id_;
    track_style.depth = ctx.depth;
    paint::CellStyle thumb_style = track_style;
    thumb_style.foreground = config::kScrollbarThumbColor;
    paint::CellStyle indicator_style = track_style;
    indicator_style.foreground = computed_style().color;

    auto clip = ctx.clip_area();
    layout::Rect track = scrollbar_track_rect();

    if (scrollbar_extent() > 0) {
        auto g = scrollbar_geometry();
        for (int i = 0; i < g.track_length; ++i) {
            bool thumb = i >= g.thumb_offset && i < g.thumb_offset + g.thumb_size;
            int x = horizontal_ ? track.x + i : track.x;
            int y = horizontal_ ? track.y : track.y + i;
            if (thumb) {
                buffer.write_text(x, y, config::kScrollbarThumbChar, thumb_style, clip);
            } else {
                const char* glyph = horizontal_ ? config::kScrollbarHTrackChar
                                                : config::kScrollbarTrackChar;
                buffer.write_text(x, y, glyph, track_style, clip);
            }
        }
    } else {
        // Without a scrollbar the indicators sit on the last visible column
        // (or row).
        track = horizontal_ ? layout::Rect{track.x, track.y - 1, track.width, 1}
                            : layout::Rect{track.x - 1, track.y, 1, track.height};
    }

    if (horizontal_) {
        if (has_content_left()) {
            buffer.write_text(track.x, track.y, config::kScrollLeftIndicator, indicator_style, clip);
        }
        if (has_content_right()) {
            buffer.write_text(track.right() - 1, track.y, config::kScrollRightIndicator,
                              indicator_style, clip);
        }
    } else {
        if (has_content_above()) {
            buffer.write_text(track.x, track.y, config::kScrollUpIndicator, indicator_style, clip);
        }
        if (has_content_below()) {
            buffer.write_text(track.x, track.bottom() - 1, config::kScrollDownIndicator,
                              indicator_style, clip);
        }
    }
}

} // namespace cellflow::tree
