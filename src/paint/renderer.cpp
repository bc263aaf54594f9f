#include <cellflow/paint/renderer.h>
#include <cellflow/core/config.h>
#include <cellflow/paint/paint_context.h>
#include <cellflow/tree/scroll_view.h>
#include <algorithm>
#include <exception>

namespace cellflow::paint {

Renderer::Renderer() {
    engine_.set_diagnostics(&diagnostics_);
    resolver_.set_diagnostics(&diagnostics_);
    engine_.set_error_handler([this](const layout::LayoutError& error) {
        record_failure(error);
    });
}

bool Renderer::render(tree::Node& root, CellBuffer& buffer) {
    ++pass_;
    diagnostics_.set_correlation_id(pass_);
    clear();
    std::size_t failures_before = failures_.size();

    // Layout
    engine_.set_viewport(buffer.width(), buffer.height());
    begin_pass(root);
    layout::Dimensions dims;
    try {
        dims = engine_.compute_layout(root, layout::LayoutConstraints::bounded(buffer.width(),
                                                                               buffer.height()));
    } catch (const std::exception& e) {
        // The root has no parent to isolate it; report it like any other node.
        root.set_layout_failed(true);
        layout::LayoutError error;
        error.node_type = root.node_type();
        error.constraints = layout::LayoutConstraints::bounded(buffer.width(), buffer.height());
        error.message = e.what();
        diagnostics_.error("layout", "compute",
                           std::string(tree::node_type_name(root.node_type())) + " (root): " +
                           error.message);
        record_failure(error);
        buffer.clear();
        return false;
    }

    // Placement
    root.set_bounds({0, 0, dims.width, dims.height});
    root.set_screen_rect(root.bounds());
    place_children(root);

    // Stacking and clipping
    stacking_.build(root);
    Viewport& root_viewport = viewports_.create_viewport(root, buffer.rect());

    // Paint
    buffer.clear();
    for (tree::Node* node : stacking_.global_rendering_order()) {
        PaintContext ctx;
        ctx.viewport = &root_viewport;
        ctx.viewports = &viewports_;
        ctx.depth = paint_depth(*node);
        ctx.layer_id = layer_id(*node);
        node->paint(buffer, ctx);
    }

    return failures_.size() == failures_before;
}

void Renderer::clear() {
    stacking_.clear();
    viewports_.clear();
}

void Renderer::record_failure(const layout::LayoutError& error) {
    auto& trace = failures_.capture(diagnostics_, error.kind, "layout", "compute", error.message);
    trace.add_snapshot("node_type", tree::node_type_name(error.node_type));
    trace.add_snapshot("position", std::to_string(error.x) + "," + std::to_string(error.y));
    trace.add_snapshot("constraints", layout::to_string(error.constraints));
}

void Renderer::begin_pass(tree::Node& node) {
    node.resolve_style(resolver_);
    node.set_layout_failed(false);
    node.clear_dirty();
    for (auto& child : node.children()) {
        begin_pass(*child);
    }
}

void Renderer::place_children(tree::Node& node) {
    layout::Rect content = node.content_screen_rect();
    int origin_x = content.x;
    int origin_y = content.y;
    if (node.node_type() == tree::NodeType::ScrollView) {
        const auto& view = static_cast<const tree::ScrollViewNode&>(node);
        origin_x -= view.scroll_left();
        origin_y -= view.scroll_top();
    }

    for (auto& child_ptr : node.children()) {
        tree::Node& child = *child_ptr;
        const auto& cs = child.computed_style();
        if (child.layout_failed() || cs.display == style::Display::None) {
            child.set_screen_rect({});
            continue;
        }
        // Fixed boxes are laid out against the buffer itself.
        if (cs.position == style::Position::Fixed) {
            child.set_screen_rect(child.bounds());
        } else {
            child.set_screen_rect(child.bounds().translated(origin_x, origin_y));
        }
        place_children(child);
    }
}

const StackingContext* Renderer::nearest_context(const tree::Node& node) const {
    for (const tree::Node* n = &node; n; n = n->parent()) {
        if (const StackingContext* context = stacking_.find_context(*n)) return context;
    }
    return nullptr;
}

int Renderer::paint_depth(const tree::Node& node) const {
    const StackingContext* context = nearest_context(node);
    if (!context) return 0;

    if (context->root == &node) {
        // A context root sits under its negative layers.
        int depth = context->z_index;
        for (const StackingContext* child : context->child_contexts) {
            depth = std::min(depth, child->z_index);
        }
        return depth;
    }
    // Positioned nodes with a non-zero z create their own context, so every
    // member paints at its context's depth.
    return context->z_index;
}

std::string Renderer::layer_id(const tree::Node& node) const {
    const StackingContext* context = nearest_context(node);
    if (!context || context == stacking_.root_context()) {
        return core::config::kRootLayerId;
    }
    return "layer-" + std::to_string(context->root->id());
}

} // namespace cellflow::paint
