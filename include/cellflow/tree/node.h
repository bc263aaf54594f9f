#pragma once
#include <cellflow/layout/box.h>
#include <cellflow/style/computed_style.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cellflow::paint {
class CellBuffer;
struct PaintContext;
}

namespace cellflow::style { class StyleResolver; }

namespace cellflow::tree {

enum class NodeType {
    Box, Text, ScrollView, Button, Input, Checkbox, Radio, Dropdown, List
};

const char* node_type_name(NodeType type);
bool is_interactive(NodeType type);

enum class DirtyFlags : uint8_t {
    None = 0,
    Style = 1 << 0,
    Layout = 1 << 1,
    Paint = 1 << 2,
    All = Style | Layout | Paint
};

inline DirtyFlags operator|(DirtyFlags a, DirtyFlags b) {
    return static_cast<DirtyFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline DirtyFlags operator&(DirtyFlags a, DirtyFlags b) {
    return static_cast<DirtyFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline bool has_flag(DirtyFlags flags, DirtyFlags flag) {
    return (flags & flag) != DirtyFlags::None;
}

class Node {
public:
    explicit Node(NodeType type);
    virtual ~Node();

    // Non-copyable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    std::uint64_t id() const { return id_; }
    NodeType node_type() const { return type_; }
    bool interactive() const { return is_interactive(type_); }

    Node* parent() const { return parent_; }
    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }
    size_t child_count() const { return children_.size(); }
    Node* child_at(size_t index) const;

    // Tree manipulation
    Node& append_child(std::unique_ptr<Node> child);
    Node& insert_before(std::unique_ptr<Node> child, Node* reference);
    std::unique_ptr<Node> remove_child(Node& child);

    template<typename T, typename... Args>
    T& add(Args&&... args) {
        return static_cast<T&>(append_child(std::make_unique<T>(std::forward<Args>(args)...)));
    }

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    // Style
    void set_style(const std::string& name, style::StyleValue value);
    void set_style(style::StyleMap styles);
    const style::StyleMap& inline_style() const { return inline_style_; }
    const style::ComputedStyle& computed_style() const;
    // Fills the computed-style cache through `resolver` when it is stale,
    // so malformed values are reported to the resolver's diagnostics.
    void resolve_style(const style::StyleResolver& resolver);

    layout::EdgeSizes margin() const { return computed_style().margin; }
    layout::EdgeSizes padding() const { return computed_style().padding; }
    layout::EdgeSizes border() const { return computed_style().border(); }

    const std::optional<std::string>& content() const { return content_; }
    void set_content(std::string text);

    // Layout results, relative to the parent's content box.
    const layout::Rect& bounds() const { return bounds_; }
    void set_bounds(const layout::Rect& bounds) { bounds_ = bounds; }
    const layout::Dimensions& dimensions() const { return dimensions_; }
    void set_dimensions(const layout::Dimensions& dims) { dimensions_ = dims; }
    const std::vector<layout::ChildLayout>& child_layouts() const { return child_layouts_; }
    void set_child_layouts(std::vector<layout::ChildLayout> layouts) {
        child_layouts_ = std::move(layouts);
    }
    bool layout_failed() const { return layout_failed_; }
    void set_layout_failed(bool failed) { layout_failed_ = failed; }

    // Buffer coordinates, written by the renderer before paint.
    const layout::Rect& screen_rect() const { return screen_rect_; }
    void set_screen_rect(const layout::Rect& rect) { screen_rect_ = rect; }
    layout::Rect content_screen_rect() const;

    void mark_dirty(DirtyFlags flags);
    DirtyFlags dirty_flags() const { return dirty_; }
    void clear_dirty() { dirty_ = DirtyFlags::None; }

    // Intrinsic content size of a leaf, or nullopt for nodes whose size
    // comes from their children.
    virtual std::optional<layout::Size> measure_content(std::optional<int> max_width) const;

    // Paints this node only; descendants are painted by the renderer
    // unless paints_descendants() is true.
    virtual void paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx);
    virtual bool paints_descendants() const { return false; }

protected:
    virtual style::StyleMap default_style() const { return {}; }
    void paint_box(paint::CellBuffer& buffer, const paint::PaintContext& ctx) const;

    NodeType type_;
    std::uint64_t id_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
    DirtyFlags dirty_ = DirtyFlags::All;

    style::StyleMap inline_style_;
    mutable std::optional<style::ComputedStyle> computed_;
    std::optional<std::string> content_;

    layout::Rect bounds_;
    layout::Dimensions dimensions_;
    std::vector<layout::ChildLayout> child_layouts_;
    layout::Rect screen_rect_;
    bool layout_failed_ = false;
};

} // namespace cellflow::tree
