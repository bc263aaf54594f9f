#include <gtest/gtest.h>
#include <cellflow/paint/stacking_context.h>
#include <cellflow/tree/nodes.h>
#include <cellflow/tree/scroll_view.h>

#include <algorithm>
#include <vector>

using namespace cellflow;
using namespace cellflow::paint;

namespace {

tree::BoxNode& add_layer(tree::Node& parent, int z, const char* position = "absolute") {
    auto& box = parent.add<tree::BoxNode>();
    box.set_style({{"position", std::string(position)}, {"zIndex", static_cast<double>(z)}});
    return box;
}

int index_of(const std::vector<tree::Node*>& order, const tree::Node& node) {
    auto it = std::find(order.begin(), order.end(), &node);
    return it == order.end() ? -1 : static_cast<int>(it - order.begin());
}

} // namespace

// 1. Which nodes create a stacking context
TEST(StackingContextTest, CreationRules) {
    tree::BoxNode root;
    auto& plain = root.add<tree::BoxNode>();
    auto& positioned_zero = add_layer(root, 0);
    auto& positioned = add_layer(root, 2);
    auto& fixed = add_layer(root, 0, "fixed");
    auto& sticky = add_layer(root, 0, "sticky");
    auto& flex = root.add<tree::BoxNode>();
    flex.set_style({{"display", std::string("flex")}, {"zIndex", 1.0}});
    auto& static_z = root.add<tree::BoxNode>();
    static_z.set_style("zIndex", 4.0);

    EXPECT_TRUE(StackingContextManager::creates_stacking_context(root));
    EXPECT_FALSE(StackingContextManager::creates_stacking_context(plain));
    EXPECT_FALSE(StackingContextManager::creates_stacking_context(positioned_zero));
    EXPECT_TRUE(StackingContextManager::creates_stacking_context(positioned));
    EXPECT_TRUE(StackingContextManager::creates_stacking_context(fixed));
    EXPECT_TRUE(StackingContextManager::creates_stacking_context(sticky));
    EXPECT_TRUE(StackingContextManager::creates_stacking_context(flex));
    EXPECT_FALSE(StackingContextManager::creates_stacking_context(static_z));
}

// 2. Sibling layers paint in ascending z order
TEST(StackingContextTest, SiblingsOrderedByZ) {
    tree::BoxNode root;
    const int z_values[] = {-1, 0, 2, 0, -2};
    std::vector<tree::Node*> layers;
    for (int z : z_values) layers.push_back(&add_layer(root, z));

    StackingContextManager manager;
    manager.build(root);
    auto order = manager.global_rendering_order();

    ASSERT_EQ(order.size(), 6u);
    EXPECT_EQ(order[0], &root);
    EXPECT_EQ(order[1], layers[4]);  // z=-2
    EXPECT_EQ(order[2], layers[0]);  // z=-1
    EXPECT_EQ(order[3], layers[1]);  // z=0, document order
    EXPECT_EQ(order[4], layers[3]);
    EXPECT_EQ(order[5], layers[2]);  // z=2
}

// 3. In-flow content sits between negative and positive layers
TEST(StackingContextTest, InFlowBetweenLayers) {
    tree::BoxNode root;
    auto& above = add_layer(root, 1);
    auto& flow = root.add<tree::BoxNode>();
    auto& below = add_layer(root, -1);

    StackingContextManager manager;
    manager.build(root);
    auto order = manager.global_rendering_order();

    EXPECT_LT(index_of(order, below), index_of(order, flow));
    EXPECT_LT(index_of(order, flow), index_of(order, above));
}

// 4. Contexts nest and their subtrees stay together
TEST(StackingContextTest, NestedContexts) {
    tree::BoxNode root;
    auto& outer = add_layer(root, 1);
    auto& inner_child = outer.add<tree::BoxNode>();
    auto& nested = add_layer(outer, 5);
    auto& sibling = add_layer(root, 2);

    StackingContextManager manager;
    manager.build(root);

    StackingContext* outer_ctx = manager.find_context(outer);
    ASSERT_NE(outer_ctx, nullptr);
    EXPECT_EQ(outer_ctx->parent, manager.root_context());
    ASSERT_EQ(outer_ctx->child_contexts.size(), 1u);
    EXPECT_EQ(outer_ctx->child_contexts[0]->root, &nested);
    ASSERT_EQ(outer_ctx->members.size(), 1u);
    EXPECT_EQ(outer_ctx->members[0].node, &inner_child);
    EXPECT_EQ(manager.size(), 4u);

    // z=5 inside z=1 still paints below the z=2 sibling.
    auto order = manager.global_rendering_order();
    EXPECT_LT(index_of(order, nested), index_of(order, sibling));
    EXPECT_LT(index_of(order, outer), index_of(order, inner_child));
}

// 5. Positioned z=0 members paint after in-flow members
TEST(StackingContextTest, PositionedZeroAfterFlow) {
    tree::BoxNode root;
    auto& relative = root.add<tree::BoxNode>();
    relative.set_style("position", std::string("relative"));
    auto& flow = root.add<tree::BoxNode>();

    StackingContextManager manager;
    manager.build(root);
    auto order = manager.global_rendering_order();

    EXPECT_LT(index_of(order, flow), index_of(order, relative));
}

// 6. Hidden and self-painting subtrees are not registered
TEST(StackingContextTest, SkipsHiddenAndSelfPaintingSubtrees) {
    tree::BoxNode root;
    auto& hidden = root.add<tree::BoxNode>();
    hidden.set_style("display", std::string("none"));
    hidden.add<tree::BoxNode>();
    auto& scroll = root.add<tree::ScrollViewNode>();
    auto& scrolled = scroll.add<tree::TextNode>("row");

    StackingContextManager manager;
    manager.build(root);
    auto order = manager.global_rendering_order();

    EXPECT_EQ(index_of(order, hidden), -1);
    EXPECT_NE(index_of(order, scroll), -1);
    EXPECT_EQ(index_of(order, scrolled), -1);
    EXPECT_EQ(order.size(), 2u);
}

// 7. clear drops every context
TEST(StackingContextTest, Clear) {
    tree::BoxNode root;
    add_layer(root, 3);
    StackingContextManager manager;
    manager.build(root);
    EXPECT_EQ(manager.size(), 2u);

    manager.clear();
    EXPECT_EQ(manager.size(), 0u);
    EXPECT_EQ(manager.root_context(), nullptr);
    EXPECT_TRUE(manager.global_rendering_order().empty());
}

// 8. Members carry their in-flow descendants; positioned descendants stand alone
TEST(StackingContextTest, MembersCarryTheirSubtrees) {
    tree::BoxNode root;
    auto& holder = root.add<tree::BoxNode>();
    auto& shifted = holder.add<tree::BoxNode>();
    shifted.set_style("position", std::string("relative"));
    auto& shifted_text = shifted.add<tree::TextNode>("up");
    auto& sibling = root.add<tree::BoxNode>();
    auto& sibling_text = sibling.add<tree::TextNode>("flow");

    StackingContextManager manager;
    manager.build(root);

    const StackingContext* context = manager.root_context();
    ASSERT_EQ(context->members.size(), 3u);
    EXPECT_EQ(context->members[0].node, &holder);
    EXPECT_TRUE(context->members[0].subtree.empty());
    EXPECT_EQ(context->members[1].node, &shifted);
    ASSERT_EQ(context->members[1].subtree.size(), 1u);
    EXPECT_EQ(context->members[1].subtree[0], &shifted_text);
    EXPECT_EQ(context->members[2].node, &sibling);

    auto order = manager.global_rendering_order();
    ASSERT_EQ(order.size(), 6u);
    EXPECT_EQ(order[1], &holder);
    EXPECT_EQ(order[2], &sibling);
    EXPECT_EQ(order[3], &sibling_text);
    EXPECT_EQ(order[4], &shifted);
    EXPECT_EQ(order[5], &shifted_text);
}
