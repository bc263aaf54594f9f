#pragma once
#include <cellflow/tree/node.h>
#include <string>
#include <vector>

namespace cellflow::tree {

class BoxNode : public Node {
public:
    BoxNode() : Node(NodeType::Box) {}

protected:
    explicit BoxNode(NodeType type) : Node(type) {}
};

// Vertical stack of items.
class ListNode : public BoxNode {
public:
    ListNode() : BoxNode(NodeType::List) {}

protected:
    style::StyleMap default_style() const override;
};

class TextNode : public Node {
public:
    explicit TextNode(std::string text = {});

    const std::string& text() const { return *content_; }
    void set_text(std::string text) { set_content(std::move(text)); }

    std::vector<std::string> wrapped_lines(int width) const;

    std::optional<layout::Size> measure_content(std::optional<int> max_width) const override;
    void paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) override;
};

// Single-line interactive control rendered from a label.
class WidgetNode : public Node {
public:
    const std::string& label() const { return label_; }
    void set_label(std::string label);

    bool focused() const { return focused_; }
    void set_focused(bool focused);

    virtual std::string display_text() const { return label_; }

    std::optional<layout::Size> measure_content(std::optional<int> max_width) const override;
    void paint(paint::CellBuffer& buffer, const paint::PaintContext& ctx) override;

protected:
    WidgetNode(NodeType type, std::string label);

    std::string label_;
    bool focused_ = false;
};

class ButtonNode : public WidgetNode {
public:
    explicit ButtonNode(std::string label = {}) : WidgetNode(NodeType::Button, std::move(label)) {}
};

class InputNode : public WidgetNode {
public:
    explicit InputNode(std::string placeholder = {})
        : WidgetNode(NodeType::Input, std::move(placeholder)) {}

    const std::string& value() const { return value_; }
    void set_value(std::string value);

    // Placeholder (the label) while empty.
    std::string display_text() const override;

private:
    std::string value_;
};

class CheckboxNode : public WidgetNode {
public:
    explicit CheckboxNode(std::string label = {}, bool checked = false)
        : WidgetNode(NodeType::Checkbox, std::move(label)), checked_(checked) {}

    bool checked() const { return checked_; }
    void set_checked(bool checked);
    void toggle() { set_checked(!checked_); }

    std::string display_text() const override;

private:
    bool checked_;
};

class RadioNode : public WidgetNode {
public:
    explicit RadioNode(std::string label = {}, bool selected = false)
        : WidgetNode(NodeType::Radio, std::move(label)), selected_(selected) {}

    bool selected() const { return selected_; }
    // Selecting a radio clears its selected siblings.
    void select();
    void set_selected(bool selected);

    std::string display_text() const override;

private:
    bool selected_;
};

class DropdownNode : public WidgetNode {
public:
    explicit DropdownNode(std::vector<std::string> options = {})
        : WidgetNode(NodeType::Dropdown, {}), options_(std::move(options)) {}

    const std::vector<std::string>& options() const { return options_; }
    int selected_index() const { return selected_index_; }
    // Out-of-range indices are clamped.
    void select(int index);

    std::string display_text() const override;

private:
    std::vector<std::string> options_;
    int selected_index_ = 0;
};

} // namespace cellflow::tree
