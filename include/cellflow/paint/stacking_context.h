#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cellflow::tree { class Node; }

namespace cellflow::paint {

struct StackingContext {
    struct Member {
        tree::Node* node = nullptr;
        int z_index = 0;
        // Non-positioned descendants painted right after `node`, in
        // document order. Positioned descendants and child contexts are
        // registered on their own.
        std::vector<tree::Node*> subtree;
    };

    tree::Node* root = nullptr;
    int z_index = 0;
    StackingContext* parent = nullptr;
    // Direct children of the root that do not create a context, plus
    // positioned descendants whose nearest context is this one. Document
    // order.
    std::vector<Member> members;
    std::vector<StackingContext*> child_contexts;
};

// Per-render-tree table of stacking contexts. Rebuilt for every pass.
class StackingContextManager {
public:
    // The tree root, positioned nodes with a non-zero z-index, fixed and
    // sticky nodes, and flex/grid containers with a non-zero z-index.
    static bool creates_stacking_context(const tree::Node& node);

    // Creates the context on first access and links it under the context
    // of the nearest creating ancestor.
    StackingContext& get_context(tree::Node& node);
    StackingContext* find_context(const tree::Node& node) const;
    StackingContext* root_context() const { return root_; }

    // Registers every paintable node under `root`. Subtrees that paint
    // their own descendants, failed nodes and display:none nodes are not
    // descended into.
    void build(tree::Node& root);

    // Root, negative contexts, in-flow members, z=0 contexts, positioned
    // z=0 members, positive contexts, positive members. Child contexts
    // are expanded recursively in place; each member is followed by its
    // subtree.
    std::vector<tree::Node*> rendering_order(const StackingContext& context) const;
    std::vector<tree::Node*> global_rendering_order() const;

    void clear();
    std::size_t size() const { return contexts_.size(); }

private:
    // Nearest ancestor context, creating it if needed.
    StackingContext& enclosing_context(tree::Node& node);
    // `owner` is the index of the member that carries `node`'s in-flow
    // descendants, or nullopt when `node` is the context root.
    void collect(tree::Node& node, StackingContext& context, std::optional<std::size_t> owner);

    std::vector<std::unique_ptr<StackingContext>> contexts_;
    std::unordered_map<const tree::Node*, StackingContext*> by_node_;
    StackingContext* root_ = nullptr;
};

} // namespace cellflow::paint
