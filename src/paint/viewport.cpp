#include <cellflow/paint/viewport.h>
#include <cellflow/tree/node.h>

namespace cellflow::paint {

Viewport::Viewport(const layout::Rect& bounds, Viewport* parent)
    : bounds_(bounds), clipping_area_(bounds), parent_(parent) {
    if (parent_) {
        parent_->children_.push_back(this);
        update_clipping_area();
    }
}

std::optional<layout::Rect> Viewport::clip(const layout::Rect& region) const {
    if (!intersects(region)) return std::nullopt;
    return clipping_area_.intersect(region);
}

void Viewport::set_scroll(int x, int y) {
    scroll_x_ = x;
    scroll_y_ = y;
    update_clipping_area();
}

void Viewport::update_clipping_area() {
    clipping_area_ = bounds_.translated(-scroll_x_, -scroll_y_);
    if (clipping_area_.width < 0) clipping_area_.width = 0;
    if (clipping_area_.height < 0) clipping_area_.height = 0;

    if (parent_) {
        auto clipped = parent_->clip(clipping_area_);
        clipping_area_ = clipped ? *clipped : layout::Rect{};
    }

    for (Viewport* child : children_) {
        child->update_clipping_area();
    }
}

Viewport& ViewportManager::create_viewport(const tree::Node& node, const layout::Rect& bounds,
                                           Viewport* parent) {
    if (!parent) {
        for (const tree::Node* p = node.parent(); p; p = p->parent()) {
            if (Viewport* vp = get_viewport(*p)) {
                parent = vp;
                break;
            }
        }
    }

    owned_.push_back(std::make_unique<Viewport>(bounds, parent));
    Viewport* viewport = owned_.back().get();
    by_node_[&node] = viewport;
    if (!node.parent() && !root_) {
        root_ = viewport;
    }
    return *viewport;
}

Viewport& ViewportManager::create_anonymous(const layout::Rect& bounds, Viewport* parent) {
    owned_.push_back(std::make_unique<Viewport>(bounds, parent));
    return *owned_.back();
}

Viewport* ViewportManager::get_viewport(const tree::Node& node) const {
    auto it = by_node_.find(&node);
    return it == by_node_.end() ? nullptr : it->second;
}

void ViewportManager::clear() {
    by_node_.clear();
    owned_.clear();
    root_ = nullptr;
}

} // namespace cellflow::paint
