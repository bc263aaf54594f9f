#pragma once
#include <cellflow/core/config.h>
#include <cellflow/core/diagnostics.h>
#include <cellflow/layout/box.h>
#include <cellflow/style/computed_style.h>
#include <cellflow/tree/node.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cellflow::tree { class ScrollViewNode; }

namespace cellflow::layout {

// Reported for every node whose layout threw. The node is left with an
// empty layout and flagged failed; its siblings are still laid out.
struct LayoutError {
    core::ErrorKind kind = core::ErrorKind::LayoutCalculation;
    tree::NodeType node_type = tree::NodeType::Box;
    int x = 0;
    int y = 0;
    LayoutConstraints constraints;
    std::string message;
};

using LayoutErrorHandler = std::function<void(const LayoutError&)>;

// How an auto width is resolved: fill the available width (block flow)
// or shrink to the content (flex items, out-of-flow boxes).
enum class WidthMode { Fill, FitContent };

struct SizeRequest {
    WidthMode width_mode = WidthMode::Fill;
    // Border-box sizes imposed by the parent algorithm (flex grow,
    // stretch, grid areas). They bypass min/max clamping.
    std::optional<int> exact_width;
    std::optional<int> exact_height;
    // Sizing probe ahead of the final layout. Scroll views inside keep
    // their scroll state; only the final pass updates it.
    bool measure_only = false;
};

class LayoutEngine {
public:
    // Sizes `node` itself, lays out its subtree and records the result on
    // the node. Child bounds are written relative to the node's content box.
    Dimensions compute_layout(tree::Node& node, const LayoutConstraints& constraints,
                              const SizeRequest& request = {});

    // Lays out the children of `node` inside a content box described by
    // `constraints`, dispatching on the node's display mode. Results come
    // back in document order; failed and hidden children are omitted.
    std::vector<ChildLayout> layout(tree::Node& node, const LayoutConstraints& constraints);

    // Reference size for vw/vh units and fixed positioning.
    void set_viewport(int width, int height) { viewport_ = {width, height}; }
    const style::ViewportSize& viewport() const { return viewport_; }

    void set_error_handler(LayoutErrorHandler handler) { error_handler_ = std::move(handler); }
    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }

private:
    // layout() plus the in-flow extent, measured before relative offsets.
    std::vector<ChildLayout> layout_children(tree::Node& node, const LayoutConstraints& constraints,
                                             Size& extent);
    std::vector<ChildLayout> layout_block(tree::Node& node, const LayoutConstraints& constraints);
    std::vector<ChildLayout> layout_flex(tree::Node& node, const LayoutConstraints& constraints);
    std::vector<ChildLayout> layout_grid(tree::Node& node, const LayoutConstraints& constraints);

    // Absolute and fixed children, placed against the content box once
    // the in-flow extent is known.
    void layout_out_of_flow(tree::Node& node, const LayoutConstraints& constraints,
                            const Size& extent, std::vector<ChildLayout>& layouts);
    void apply_relative_offsets(std::vector<ChildLayout>& layouts,
                                const LayoutConstraints& constraints) const;

    Size layout_scroll_view(tree::ScrollViewNode& view, const LayoutConstraints& inner,
                            std::optional<int> max_width, std::optional<int> max_height,
                            std::vector<ChildLayout>& layouts);

    // compute_layout inside the per-node failure boundary. Nullopt when
    // the child failed and was reported.
    std::optional<Dimensions> layout_child(tree::Node& child, const LayoutConstraints& constraints,
                                           const SizeRequest& request, int x, int y);
    void report_failure(tree::Node& child, const LayoutConstraints& constraints,
                        int x, int y, const std::string& message);

    std::optional<int> resolve_width(const style::Dimension& d,
                                     const LayoutConstraints& constraints) const {
        return d.resolve(constraints.available_width, viewport_);
    }
    std::optional<int> resolve_height(const style::Dimension& d,
                                      const LayoutConstraints& constraints) const {
        return d.resolve(constraints.available_height, viewport_);
    }

    style::ViewportSize viewport_{core::config::kDefaultColumns, core::config::kDefaultRows};
    // Number of measure_only requests currently on the stack.
    int measure_depth_ = 0;
    LayoutErrorHandler error_handler_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

// Bottom-right extent of the in-flow boxes in `layouts`, margins included.
Size content_extent(const std::vector<ChildLayout>& layouts);

} // namespace cellflow::layout
