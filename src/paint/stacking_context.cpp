#include <cellflow/paint/stacking_context.h>
#include <cellflow/tree/node.h>
#include <algorithm>

namespace cellflow::paint {

namespace {

bool is_positioned(const tree::Node& node) {
    return node.computed_style().is_positioned();
}

} // namespace

bool StackingContextManager::creates_stacking_context(const tree::Node& node) {
    if (!node.parent()) return true;
    const auto& cs = node.computed_style();
    if (cs.position == style::Position::Fixed || cs.position == style::Position::Sticky) {
        return true;
    }
    if (cs.z_index == 0) return false;
    return cs.is_positioned() || cs.display == style::Display::Flex ||
           cs.display == style::Display::Grid;
}

StackingContext& StackingContextManager::get_context(tree::Node& node) {
    auto it = by_node_.find(&node);
    if (it != by_node_.end()) return *it->second;

    auto context = std::make_unique<StackingContext>();
    context->root = &node;
    context->z_index = node.parent() ? node.computed_style().z_index : 0;
    StackingContext* created = context.get();
    contexts_.push_back(std::move(context));
    by_node_[&node] = created;

    if (node.parent()) {
        StackingContext& parent = enclosing_context(node);
        created->parent = &parent;
        parent.child_contexts.push_back(created);
    } else if (!root_) {
        root_ = created;
    }
    return *created;
}

StackingContext* StackingContextManager::find_context(const tree::Node& node) const {
    auto it = by_node_.find(&node);
    return it == by_node_.end() ? nullptr : it->second;
}

StackingContext& StackingContextManager::enclosing_context(tree::Node& node) {
    tree::Node* p = node.parent();
    while (p->parent()) {
        if (StackingContext* found = find_context(*p)) return *found;
        if (creates_stacking_context(*p)) return get_context(*p);
        p = p->parent();
    }
    return get_context(*p);
}

void StackingContextManager::build(tree::Node& root) {
    StackingContext& context = get_context(root);
    if (!root.paints_descendants()) {
        collect(root, context, std::nullopt);
    }
}

void StackingContextManager::collect(tree::Node& node, StackingContext& context,
                                     std::optional<std::size_t> owner) {
    for (auto& child_ptr : node.children()) {
        tree::Node& child = *child_ptr;
        if (child.layout_failed() || child.computed_style().display == style::Display::None) {
            continue;
        }

        if (creates_stacking_context(child)) {
            StackingContext& nested = get_context(child);
            if (!child.paints_descendants()) {
                collect(child, nested, std::nullopt);
            }
            continue;
        }

        std::optional<std::size_t> carrier = owner;
        if (!owner || is_positioned(child)) {
            context.members.push_back({&child, child.computed_style().z_index, {}});
            carrier = context.members.size() - 1;
        } else {
            context.members[*owner].subtree.push_back(&child);
        }
        if (!child.paints_descendants()) {
            collect(child, context, carrier);
        }
    }
}

std::vector<tree::Node*> StackingContextManager::rendering_order(
    const StackingContext& context) const {
    std::vector<tree::Node*> order;
    order.push_back(context.root);

    std::vector<StackingContext*> children = context.child_contexts;
    std::stable_sort(children.begin(), children.end(),
        [](const StackingContext* a, const StackingContext* b) {
            return a->z_index < b->z_index;
        });
    auto append_contexts = [&](auto predicate) {
        for (StackingContext* child : children) {
            if (!predicate(child->z_index)) continue;
            auto nested = rendering_order(*child);
            order.insert(order.end(), nested.begin(), nested.end());
        }
    };

    append_contexts([](int z) { return z < 0; });

    auto append_member = [&order](const StackingContext::Member& m) {
        order.push_back(m.node);
        order.insert(order.end(), m.subtree.begin(), m.subtree.end());
    };

    for (const auto& m : context.members) {
        if (!is_positioned(*m.node)) append_member(m);
    }

    append_contexts([](int z) { return z == 0; });

    for (const auto& m : context.members) {
        if (is_positioned(*m.node) && m.z_index == 0) append_member(m);
    }

    append_contexts([](int z) { return z > 0; });

    std::vector<StackingContext::Member> positive;
    for (const auto& m : context.members) {
        if (is_positioned(*m.node) && m.z_index > 0) positive.push_back(m);
    }
    std::stable_sort(positive.begin(), positive.end(),
        [](const StackingContext::Member& a, const StackingContext::Member& b) {
            return a.z_index < b.z_index;
        });
    for (const auto& m : positive) append_member(m);

    return order;
}

std::vector<tree::Node*> StackingContextManager::global_rendering_order() const {
    if (!root_) return {};
    return rendering_order(*root_);
}

void StackingContextManager::clear() {
    by_node_.clear();
    contexts_.clear();
    root_ = nullptr;
}

} // namespace cellflow::paint
