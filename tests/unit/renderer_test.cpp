#include <gtest/gtest.h>
#include <cellflow/paint/renderer.h>
#include <cellflow/tree/nodes.h>

#include <stdexcept>
#include <string>

using namespace cellflow;
using paint::CellBuffer;
using paint::Renderer;

namespace {

class ThrowingText : public tree::TextNode {
public:
    explicit ThrowingText(std::string text) : TextNode(std::move(text)) {}
    std::optional<layout::Size> measure_content(std::optional<int>) const override {
        throw std::runtime_error("cannot measure");
    }
};

tree::BoxNode& add_box(tree::Node& parent, style::StyleMap styles) {
    auto& box = parent.add<tree::BoxNode>();
    box.set_style(std::move(styles));
    return box;
}

} // namespace

// 1. Text lands at its laid-out position
TEST(RendererTest, PaintsTextAtLayoutPosition) {
    tree::BoxNode root;
    root.set_style("padding", 1.0);
    root.add<tree::TextNode>("hello");

    CellBuffer buffer(10, 4);
    Renderer renderer;
    EXPECT_TRUE(renderer.render(root, buffer));
    EXPECT_EQ(buffer.line_text(1), " hello    ");
    EXPECT_EQ(buffer.line_text(0), "          ");
}

// 2. Borders and backgrounds
TEST(RendererTest, PaintsBordersAndBackground) {
    tree::BoxNode root;
    auto& panel = add_box(root, {{"width", 6.0}, {"height", 3.0},
                                 {"borderStyle", std::string("single")},
                                 {"backgroundColor", std::string("blue")}});
    panel.add<tree::TextNode>("ok");

    CellBuffer buffer(8, 4);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.cell(0, 0)->ch, "┌");
    EXPECT_EQ(buffer.cell(5, 2)->ch, "┘");
    EXPECT_EQ(buffer.cell(1, 1)->ch, "o");
    EXPECT_EQ(buffer.cell(1, 1)->background, "blue");
    EXPECT_EQ(buffer.cell(3, 1)->background, "blue");
    EXPECT_EQ(buffer.cell(6, 1)->background, "");
}

// 3. Higher z-index overlays win regardless of document order
TEST(RendererTest, ZIndexDecidesOverlap) {
    tree::BoxNode root;
    auto& top = add_box(root, {{"position", std::string("absolute")}, {"zIndex", 2.0},
                               {"left", 0.0}, {"top", 0.0}});
    top.add<tree::TextNode>("TOP");
    auto& bottom = add_box(root, {{"position", std::string("absolute")}, {"zIndex", 1.0},
                                  {"left", 0.0}, {"top", 0.0}});
    bottom.add<tree::TextNode>("low");

    CellBuffer buffer(5, 1);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.line_text(0), "TOP  ");
    EXPECT_EQ(buffer.cell(0, 0)->layer_id, "layer-" + std::to_string(top.id()));
    EXPECT_EQ(buffer.cell(0, 0)->depth, 2);
}

// 4. Negative layers paint under in-flow content
TEST(RendererTest, NegativeLayerUnderFlow) {
    tree::BoxNode root;
    root.add<tree::TextNode>("flow");
    auto& under = add_box(root, {{"position", std::string("absolute")}, {"zIndex", -1.0},
                                 {"left", 0.0}, {"top", 0.0}});
    under.add<tree::TextNode>("UNDERNEATH");

    CellBuffer buffer(12, 1);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.line_text(0), "flowRNEATH  ");
    EXPECT_EQ(buffer.cell(0, 0)->layer_id, "root");
    EXPECT_EQ(buffer.cell(5, 0)->layer_id, "layer-" + std::to_string(under.id()));
}

// 5. A failing node is skipped; its siblings render
TEST(RendererTest, FailingNodeIsIsolated) {
    tree::BoxNode root;
    root.add<tree::TextNode>("first");
    root.add<ThrowingText>("broken");
    root.add<tree::TextNode>("third");

    CellBuffer buffer(10, 3);
    Renderer renderer;
    EXPECT_FALSE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.line_text(0), "first     ");
    EXPECT_EQ(buffer.line_text(1), "third     ");

    ASSERT_EQ(renderer.failures().size(), 1u);
    const auto& trace = renderer.failures().traces()[0];
    EXPECT_EQ(trace.kind, core::ErrorKind::LayoutCalculation);
    EXPECT_EQ(trace.error_message, "cannot measure");
    EXPECT_EQ(trace.correlation_id, 1u);
    ASSERT_NE(trace.snapshot("node_type"), nullptr);
    EXPECT_EQ(*trace.snapshot("node_type"), "text");
    EXPECT_EQ(*trace.snapshot("position"), "0,1");
    EXPECT_EQ(*trace.snapshot("constraints"), "max=10x3 avail=10xinf");

    auto errors = renderer.diagnostics().events_by_severity(core::Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "layout");
    EXPECT_NE(errors[0].message.find("cannot measure"), std::string::npos);
}

// 6. Each pass reports its own failures once
TEST(RendererTest, FailuresReportedOncePerPass) {
    tree::BoxNode root;
    auto& row = add_box(root, {{"display", std::string("flex")}});
    row.add<ThrowingText>("x");

    CellBuffer buffer(10, 3);
    Renderer renderer;
    EXPECT_FALSE(renderer.render(root, buffer));
    EXPECT_FALSE(renderer.render(root, buffer));

    EXPECT_EQ(renderer.pass_count(), 2u);
    ASSERT_EQ(renderer.failures().size(), 2u);
    EXPECT_EQ(renderer.failures().traces()[1].correlation_id, 2u);
}

// 7. A root that fails leaves a blank frame
TEST(RendererTest, RootFailureBlanksFrame) {
    ThrowingText root("root");
    CellBuffer buffer(6, 2);
    buffer.write_text(0, 0, "stale", {});

    Renderer renderer;
    EXPECT_FALSE(renderer.render(root, buffer));
    EXPECT_EQ(buffer.line_text(0), "      ");
    EXPECT_TRUE(root.layout_failed());
    EXPECT_EQ(renderer.failures().size(), 1u);
}

// 8. Malformed styles are reported through the renderer's diagnostics
TEST(RendererTest, MalformedStyleWarnings) {
    tree::BoxNode root;
    add_box(root, {{"justifyContent", std::string("middle")}});
    auto& grid = add_box(root, {{"display", std::string("grid")},
                                {"gridTemplateColumns", std::string("1fr ??")}});
    grid.add<tree::TextNode>("cell");

    CellBuffer buffer(10, 3);
    Renderer renderer;
    EXPECT_TRUE(renderer.render(root, buffer));

    auto warnings = renderer.diagnostics().events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].module, "style");
    EXPECT_EQ(warnings[1].module, "layout");
    for (const auto& w : warnings) {
        EXPECT_NE(w.message.find("malformed-style"), std::string::npos);
        EXPECT_EQ(w.correlation_id, 1u);
    }
}

// 9. Fixed boxes anchor to the buffer, not their parent
TEST(RendererTest, FixedAnchorsToBuffer) {
    tree::BoxNode root;
    auto& offset = add_box(root, {{"marginLeft", 4.0}, {"marginTop", 1.0}});
    auto& pinned = add_box(offset, {{"position", std::string("fixed")},
                                    {"right", 0.0}, {"bottom", 0.0}});
    pinned.add<tree::TextNode>("!");

    CellBuffer buffer(10, 4);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(pinned.screen_rect(), (layout::Rect{9, 3, 1, 1}));
    EXPECT_EQ(buffer.cell(9, 3)->ch, "!");
}

// 10. Hidden subtrees are neither laid out nor painted
TEST(RendererTest, DisplayNoneNotPainted) {
    tree::BoxNode root;
    auto& hidden = add_box(root, {{"display", std::string("none")}});
    hidden.add<tree::TextNode>("secret");
    root.add<tree::TextNode>("shown");

    CellBuffer buffer(8, 2);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));
    EXPECT_EQ(buffer.line_text(0), "shown   ");
    EXPECT_EQ(buffer.line_text(1), "        ");
}

// 11. Rendering clears dirty flags; changes mark ancestors again
TEST(RendererTest, DirtyFlags) {
    tree::BoxNode root;
    auto& text = root.add<tree::TextNode>("a");
    EXPECT_NE(root.dirty_flags(), tree::DirtyFlags::None);

    CellBuffer buffer(4, 1);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));
    EXPECT_EQ(root.dirty_flags(), tree::DirtyFlags::None);

    text.set_text("bb");
    EXPECT_TRUE(tree::has_flag(root.dirty_flags(), tree::DirtyFlags::Layout));
    ASSERT_TRUE(renderer.render(root, buffer));
    EXPECT_EQ(buffer.line_text(0), "bb  ");
}

// 12. Widgets render their display text
TEST(RendererTest, WidgetsRender) {
    tree::BoxNode root;
    root.set_style("display", std::string("flex"));
    root.add<tree::ButtonNode>("Go");
    root.add<tree::CheckboxNode>("On", true);

    CellBuffer buffer(12, 1);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));
    EXPECT_EQ(buffer.line_text(0), "Go[x] On    ");
}

// 13. A relative box paints under its own content
TEST(RendererTest, RelativeBoxKeepsItsContent) {
    tree::BoxNode root;
    auto& badge = add_box(root, {{"position", std::string("relative")},
                                 {"backgroundColor", std::string("blue")},
                                 {"width", 6.0}, {"height", 1.0}});
    badge.add<tree::TextNode>("hi");

    CellBuffer buffer(8, 2);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.line_text(0), "hi      ");
    EXPECT_EQ(buffer.cell(0, 0)->background, "blue");
    EXPECT_EQ(buffer.cell(5, 0)->background, "blue");
    EXPECT_EQ(buffer.cell(6, 0)->background, "");
}

// 14. A positioned z=0 node paints at the depth of the layer it sits in
TEST(RendererTest, PositionedChildTakesLayerDepth) {
    tree::BoxNode root;
    add_box(root, {{"position", std::string("absolute")}, {"zIndex", 3.0},
                   {"left", 0.0}, {"top", 0.0}, {"width", 5.0}, {"height", 1.0},
                   {"backgroundColor", std::string("red")}});
    auto& top = add_box(root, {{"position", std::string("absolute")}, {"zIndex", 5.0},
                               {"left", 0.0}, {"top", 0.0}, {"width", 5.0}, {"height", 1.0}});
    auto& label = top.add<tree::TextNode>("TOP");
    label.set_style("position", std::string("relative"));

    CellBuffer buffer(6, 1);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.line_text(0), "TOP   ");
    EXPECT_EQ(buffer.cell(0, 0)->depth, 5);
    EXPECT_EQ(buffer.cell(0, 0)->layer_id, "layer-" + std::to_string(top.id()));
    EXPECT_EQ(buffer.cell(4, 0)->background, "red");
}

// 15. A positioned descendant of an in-flow box paints above later flow
TEST(RendererTest, NestedRelativeOverlapsLaterFlow) {
    tree::BoxNode root;
    auto& holder = add_box(root, {{"height", 1.0}});
    auto& shifted = add_box(holder, {{"position", std::string("relative")}, {"top", 1.0},
                                     {"width", 3.0},
                                     {"backgroundColor", std::string("green")}});
    shifted.add<tree::TextNode>("up");
    auto& below = add_box(root, {{"backgroundColor", std::string("blue")}});
    below.add<tree::TextNode>("flow");

    CellBuffer buffer(6, 2);
    Renderer renderer;
    ASSERT_TRUE(renderer.render(root, buffer));

    EXPECT_EQ(buffer.line_text(1), "up w  ");
    EXPECT_EQ(buffer.cell(2, 1)->background, "green");
    EXPECT_EQ(buffer.cell(3, 1)->background, "blue");
}
