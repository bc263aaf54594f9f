#pragma once
#include <cellflow/core/config.h>
#include <cellflow/tree/node.h>
#include <functional>
#include <optional>

namespace cellflow::tree {

struct ScrollState {
    int scroll_top = 0;
    int scroll_left = 0;
    int content_width = 0;
    int content_height = 0;
    std::optional<int> max_height;
    std::optional<int> max_width;
};

enum class ScrollKey { Up, Down, Left, Right, PageUp, PageDown, Home, End };

// Pointer input in buffer coordinates.
struct MouseEvent {
    enum class Action { Press, Drag, Release, WheelUp, WheelDown };
    Action action = Action::Press;
    int x = 0;
    int y = 0;
};

struct ScrollbarGeometry {
    int track_length = 0;
    int thumb_size = 0;
    int thumb_offset = 0;
};

class ScrollViewNode : public Node {
public:
    using ScrollCallback = std::function<void(int scroll_top, int scroll_left)>;

    ScrollViewNode();

    bool horizontal() const { return horizontal_; }
    void set_horizontal(bool horizontal);
    int scroll_step() const { return scroll_step_; }
    void set_scroll_step(int step) { scroll_step_ = step > 0 ? step : 1; }
    bool show_scrollbar() const { return show_scrollbar_; }
    void set_show_scrollbar(bool show);
    bool auto_scroll_to_bottom() const { return auto_scroll_to_bottom_; }
    void set_auto_scroll_to_bottom(bool enabled) { auto_scroll_to_bottom_ = enabled; }
    void set_max_height(int rows) { set_style("maxHeight", static_cast<double>(rows)); }
    void set_max_width(int columns) { set_style("maxWidth", static_cast<double>(columns)); }
    void set_on_scroll(ScrollCallback callback) { on_scroll_ = std::move(callback); }

    const ScrollState& scroll_state() const { return state_; }
    int scroll_top() const { return state_.scroll_top; }
    int scroll_left() const { return state_.scroll_left; }
    int viewport_width() const { return viewport_width_; }
    int viewport_height() const { return viewport_height_; }
    int max_scroll_top() const;
    int max_scroll_left() const;

    bool can_scroll_vertically() const { return state_.content_height > viewport_height_; }
    bool can_scroll_horizontally() const { return state_.content_width > viewport_width_; }
    // Within one row of the bottom counts as at the bottom.
    bool is_at_bottom() const;
    bool has_content_above() const { return state_.scroll_top > 0; }
    bool has_content_below() const {
        return state_.scroll_top + viewport_height_ < state_.content_height;
    }
    bool has_content_left() const { return state_.scroll_left > 0; }
    bool has_content_right() const {
        return state_.scroll_left + viewport_width_ < state_.content_width;
    }

    // Each returns true when the clamped position changed.
    bool scroll_by(int delta_y, int delta_x = 0);
    bool scroll_to(int top, std::optional<int> left = std::nullopt);
    bool scroll_to_node(const Node& target);
    bool scroll_to_top();
    bool scroll_to_end();

    bool handle_key(ScrollKey key);
    bool handle_mouse(const MouseEvent& event);
    bool dragging_thumb() const { return dragging_thumb_; }

    // Along the vertical axis, or the horizontal one in horizontal mode.
    ScrollbarGeometry scrollbar_geometry() const;
    // Columns (or rows, horizontally) taken by the scrollbar.
    int scrollbar_extent() const;

    // Called by the layout engine once the visible window and the
    // content extent are known. Re-pins to the bottom when auto-scroll
    // applies, then re-clamps the offsets.
    void update_layout(const layout::Size& viewport, const layout::Size& content,
                       std::optional<int> max_width, std::optional<int> max_height);

    void paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) override;
    bool paints_descendants() const override { return true; }

private:
    void notify_scroll();
    layout::Rect scrollbar_track_rect() const;
    void paint_descendants(Node& node, paint::CellBuffer& buffer,
                           const paint::PaintContext& ctx) const;
    void paint_scrollbar(paint::CellBuffer& buffer, const paint::PaintContext& ctx) const;

    ScrollState state_;
    int viewport_width_ = 0;
    int viewport_height_ = 0;
    bool horizontal_ = false;
    int scroll_step_ = core::config::kDefaultScrollStep;
    bool show_scrollbar_ = true;
    bool auto_scroll_to_bottom_ = false;
    bool dragging_thumb_ = false;
    int drag_grab_offset_ = 0;
    ScrollCallback on_scroll_;
};

} // namespace cellflow::tree
