#pragma once
#include <cellflow/core/config.h>
#include <cellflow/layout/box.h>
#include <cellflow/paint/viewport.h>
#include <optional>
#include <string>

namespace cellflow::paint {

// State handed to Node::paint for one node.
struct PaintContext {
    Viewport* viewport = nullptr;         // null paints unclipped
    ViewportManager* viewports = nullptr; // scroll views register here
    int depth = 0;
    std::string layer_id = core::config::kRootLayerId;

    std::optional<layout::Rect> clip(const layout::Rect& region) const {
        if (!viewport) return region;
        return viewport->clip(region);
    }
    std::optional<layout::Rect> clip_area() const {
        if (!viewport) return std::nullopt;
        return viewport->clipping_area();
    }
};

} // namespace cellflow::paint
