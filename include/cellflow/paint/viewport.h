#pragma once
#include <cellflow/layout/box.h>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cellflow::tree { class Node; }

namespace cellflow::paint {

// Visible window of a region. The clipping area is the bounds moved by
// the negative scroll offset, cut down to the parent's clipping area.
class Viewport {
public:
    explicit Viewport(const layout::Rect& bounds, Viewport* parent = nullptr);

    Viewport(const Viewport&) = delete;
    Viewport& operator=(const Viewport&) = delete;

    const layout::Rect& bounds() const { return bounds_; }
    int scroll_x() const { return scroll_x_; }
    int scroll_y() const { return scroll_y_; }
    const layout::Rect& clipping_area() const { return clipping_area_; }
    Viewport* parent() const { return parent_; }
    const std::vector<Viewport*>& children() const { return children_; }

    bool contains_point(int x, int y) const { return clipping_area_.contains(x, y); }
    bool intersects(const layout::Rect& region) const { return clipping_area_.intersects(region); }

    // Null when `region` lies entirely outside the clipping area.
    std::optional<layout::Rect> clip(const layout::Rect& region) const;

    // Recomputes this clipping area and every descendant's.
    void set_scroll(int x, int y);

private:
    void update_clipping_area();

    layout::Rect bounds_;
    int scroll_x_ = 0;
    int scroll_y_ = 0;
    layout::Rect clipping_area_;
    Viewport* parent_ = nullptr;
    std::vector<Viewport*> children_;
};

// Owns the viewports of one render tree, keyed by the node that created
// them. The table must be cleared before painting an unrelated tree.
class ViewportManager {
public:
    // Without an explicit parent the viewport of the nearest ancestor
    // node that has one becomes the parent.
    Viewport& create_viewport(const tree::Node& node, const layout::Rect& bounds,
                              Viewport* parent = nullptr);
    // Unkeyed helper viewport.
    Viewport& create_anonymous(const layout::Rect& bounds, Viewport* parent);

    Viewport* get_viewport(const tree::Node& node) const;
    Viewport* root_viewport() const { return root_; }

    void clear();
    size_t size() const { return owned_.size(); }

private:
    std::vector<std::unique_ptr<Viewport>> owned_;
    std::unordered_map<const tree::Node*, Viewport*> by_node_;
    Viewport* root_ = nullptr;
};

} // namespace cellflow::paint
