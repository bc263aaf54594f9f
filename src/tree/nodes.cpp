#include <cellflow/tree/nodes.h>
#include <cellflow/core/text.h>
#include <cellflow/paint/box_painter.h>
#include <algorithm>

namespace cellflow::tree {

style::StyleMap ListNode::default_style() const {
    return {{"display", std::string("flex")}, {"flexDirection", std::string("column")}};
}

TextNode::TextNode(std::string text) : Node(NodeType::Text) {
    content_ = std::move(text);
}

std::vector<std::string> TextNode::wrapped_lines(int width) const {
    return core::wrap_text(*content_, width);
}

std::optional<layout::Size> TextNode::measure_content(std::optional<int> max_width) const {
    auto lines = wrapped_lines(max_width.value_or(0));
    int width = 0;
    for (auto& line : lines) {
        width = std::max(width, core::display_width(line));
    }
    return layout::Size{std::max(1, width), static_cast<int>(lines.size())};
}

void TextNode::paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) {
    paint_box(buffer, ctx);
    layout::Rect area = content_screen_rect();
    paint::paint_lines(buffer, area, wrapped_lines(area.width),
                       paint::cell_style_for(computed_style(), id_, ctx), ctx);
}

WidgetNode::WidgetNode(NodeType type, std::string label)
    : Node(type), label_(std::move(label)) {}

void WidgetNode::set_label(std::string label) {
    label_ = std::move(label);
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
}

void WidgetNode::set_focused(bool focused) {
    if (focused_ == focused) return;
    focused_ = focused;
    mark_dirty(DirtyFlags::Paint);
}

std::optional<layout::Size> WidgetNode::measure_content(std::optional<int> max_width) const {
    int width = std::max(1, core::display_width(display_text()));
    if (max_width) width = std::min(width, std::max(1, *max_width));
    return layout::Size{width, 1};
}

void WidgetNode::paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) {
    paint_box(buffer, ctx);
    auto cs = paint::cell_style_for(computed_style(), id_, ctx);
    if (focused_) {
        // Focus swaps foreground and background.
        std::swap(cs.foreground, cs.background);
        if (cs.background.empty()) cs.background = "white";
        if (cs.foreground.empty()) cs.foreground = "black";
    }
    paint::paint_lines(buffer, content_screen_rect(), {display_text()}, cs, ctx);
}

void InputNode::set_value(std::string value) {
    value_ = std::move(value);
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
}

std::string InputNode::display_text() const {
    return value_.empty() ? label_ : value_;
}

void CheckboxNode::set_checked(bool checked) {
    if (checked_ == checked) return;
    checked_ = checked;
    mark_dirty(DirtyFlags::Paint);
}

std::string CheckboxNode::display_text() const {
    std::string text = checked_ ? "[x]" : "[ ]";
    if (!label_.empty()) text += " " + label_;
    return text;
}

void RadioNode::select() {
    if (parent_) {
        parent_->for_each_child([this](Node& sibling) {
            if (&sibling != this && sibling.node_type() == NodeType::Radio) {
                static_cast<RadioNode&>(sibling).set_selected(false);
            }
        });
    }
    set_selected(true);
}

void RadioNode::set_selected(bool selected) {
    if (selected_ == selected) return;
    selected_ = selected;
    mark_dirty(DirtyFlags::Paint);
}

std::string RadioNode::display_text() const {
    std::string text = selected_ ? "(•)" : "( )";
    if (!label_.empty()) text += " " + label_;
    return text;
}

void DropdownNode::select(int index) {
    int clamped = options_.empty()
        ? 0 : std::clamp(index, 0, static_cast<int>(options_.size()) - 1);
    if (clamped == selected_index_) return;
    selected_index_ = clamped;
    mark_dirty(DirtyFlags::Layout | DirtyFlags::Paint);
}

std::string DropdownNode::display_text() const {
    std::string current = options_.empty() ? label_ : options_[selected_index_];
    return current + " ▼";
}

} // namespace cellflow::tree
