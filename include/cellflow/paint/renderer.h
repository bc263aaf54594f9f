#pragma once
#include <cellflow/core/diagnostics.h>
#include <cellflow/layout/layout_engine.h>
#include <cellflow/paint/cell_buffer.h>
#include <cellflow/paint/stacking_context.h>
#include <cellflow/paint/viewport.h>
#include <cellflow/style/style_resolver.h>
#include <cstdint>
#include <string>

namespace cellflow::paint {

// Runs one frame: layout, screen placement, stacking, paint. Owns the
// per-tree stacking and viewport tables, rebuilt on every pass.
class Renderer {
public:
    Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Returns false when any node failed to lay out during this pass.
    // Failed subtrees are left blank; everything else is painted.
    bool render(tree::Node& root, CellBuffer& buffer);

    // Drops the stacking and viewport tables, e.g. before rendering an
    // unrelated tree.
    void clear();

    layout::LayoutEngine& layout_engine() { return engine_; }
    const StackingContextManager& stacking_contexts() const { return stacking_; }
    const ViewportManager& viewports() const { return viewports_; }

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }
    const core::FailureTraceCollector& failures() const { return failures_; }

    // Number of render() calls so far; also the correlation id of the
    // diagnostics emitted by the latest pass.
    std::uint64_t pass_count() const { return pass_; }

private:
    void record_failure(const layout::LayoutError& error);
    void begin_pass(tree::Node& node);
    void place_children(tree::Node& node);
    int paint_depth(const tree::Node& node) const;
    std::string layer_id(const tree::Node& node) const;
    const StackingContext* nearest_context(const tree::Node& node) const;

    layout::LayoutEngine engine_;
    style::StyleResolver resolver_;
    StackingContextManager stacking_;
    ViewportManager viewports_;
    core::DiagnosticEmitter diagnostics_;
    core::FailureTraceCollector failures_;
    std::uint64_t pass_ = 0;
};

} // namespace cellflow::paint
