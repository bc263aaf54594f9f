#include <cellflow/tree/node.h>
#include <cellflow/core/text.h>
#include <cellflow/paint/box_painter.h>
#include <cellflow/style/style_resolver.h>
#include <algorithm>
#include <stdexcept>

namespace cellflow::tree {

namespace {
std::uint64_t g_next_node_id = 1;
}

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Box:        return "box";
        case NodeType::Text:       return "text";
        case NodeType::ScrollView: return "scrollview";
        case NodeType::Button:     return "button";
        case NodeType::Input:      return "input";
        case NodeType::Checkbox:   return "checkbox";
        case NodeType::Radio:      return "radio";
        case NodeType::Dropdown:   return "dropdown";
        case NodeType::List:       return "list";
    }
    return "unknown";
}

bool is_interactive(NodeType type) {
    switch (type) {
        case NodeType::ScrollView:
        case NodeType::Button:
        case NodeType::Input:
        case NodeType::Checkbox:
        case NodeType::Radio:
        case NodeType::Dropdown:
            return true;
        case NodeType::Box:
        case NodeType::Text:
        case NodeType::List:
            return false;
    }
    return false;
}

Node::Node(NodeType type) : type_(type), id_(g_next_node_id++) {}

Node::~Node() = default;

Node* Node::child_at(size_t index) const {
    if (index >= children_.size()) return nullptr;
    return children_[index].get();
}

Node& Node::append_child(std::unique_ptr<Node> child) {
    return insert_before(std::move(child), nullptr);
}

Node& Node::insert_before(std::unique_ptr<Node> child, Node* reference) {
    if (!child) {
        throw std::invalid_argument("insert_before: null child");
    }
    Node* new_child = child.get();
    new_child->parent_ = this;

    if (reference == nullptr) {
        children_.push_back(std::move(child));
    } else {
        auto it = std::find_if(children_.begin(), children_.end(),
            [reference](const std::unique_ptr<Node>& c) {
                return c.get() == reference;
            });
        if (it == children_.end()) {
            throw std::invalid_argument("insert_before: reference is not a child of this node");
        }
        children_.insert(it, std::move(child));
    }
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
    return *new_child;
}

std::unique_ptr<Node> Node::remove_child(Node& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<Node>& c) {
            return c.get() == &child;
        });
    if (it == children_.end()) return nullptr;

    std::unique_ptr<Node> removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
    return removed;
}

void Node::set_style(const std::string& name, style::StyleValue value) {
    inline_style_[name] = std::move(value);
    computed_.reset();
    mark_dirty(DirtyFlags::All);
}

void Node::set_style(style::StyleMap styles) {
    for (auto& [name, value] : styles) {
        inline_style_[name] = std::move(value);
    }
    computed_.reset();
    mark_dirty(DirtyFlags::All);
}

const style::ComputedStyle& Node::computed_style() const {
    if (!computed_) {
        style::StyleResolver resolver;
        computed_ = resolver.resolve(inline_style_, default_style());
    }
    return *computed_;
}

void Node::resolve_style(const style::StyleResolver& resolver) {
    if (!computed_) {
        computed_ = resolver.resolve(inline_style_, default_style());
    }
}

void Node::set_content(std::string text) {
    content_ = std::move(text);
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
}

layout::Rect Node::content_screen_rect() const {
    auto b = border();
    auto p = padding();
    layout::Rect r = screen_rect_;
    r.x += b.left + p.left;
    r.y += b.top + p.top;
    r.width = std::max(0, r.width - b.horizontal() - p.horizontal());
    r.height = std::max(0, r.height - b.vertical() - p.vertical());
    return r;
}

void Node::mark_dirty(DirtyFlags flags) {
    dirty_ = dirty_ | flags;
    // Layout changes invalidate every ancestor's layout.
    if (has_flag(flags, DirtyFlags::Layout)) {
        for (Node* p = parent_; p; p = p->parent_) {
            p->dirty_ = p->dirty_ | DirtyFlags::Layout | DirtyFlags::Paint;
        }
    }
}

std::optional<layout::Size> Node::measure_content(std::optional<int> max_width) const {
    if (!children_.empty() || !content_) return std::nullopt;
    auto lines = core::wrap_text(*content_, max_width.value_or(0));
    int width = 0;
    for (auto& line : lines) {
        width = std::max(width, core::display_width(line));
    }
    return layout::Size{width, static_cast<int>(lines.size())};
}

void Node::paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) {
    paint_box(buffer, ctx);
    if (children_.empty() && content_) {
        layout::Rect area = content_screen_rect();
        auto lines = core::wrap_text(*content_, area.width);
        paint::paint_lines(buffer, area, lines,
                           paint::cell_style_for(computed_style(), id_, ctx), ctx);
    }
}

void Node::paint_box(paint::CellBuffer& buffer, const paint::PaintContext& ctx) const {
    const auto& cs = computed_style();
    paint::paint_background(buffer, screen_rect_, cs.background_color, id_, ctx);
    paint::paint_border(buffer, screen_rect_, cs, id_, ctx);
}

} // namespace cellflow::tree
