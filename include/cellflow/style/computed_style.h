#pragma once
#include <cellflow/layout/box.h>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cellflow::style {

enum class Display { Block, Flex, Grid, None };
enum class Position { Static, Relative, Absolute, Fixed, Sticky };
enum class FlexDirection { Row, RowReverse, Column, ColumnReverse };
enum class FlexWrap { NoWrap, Wrap, WrapReverse };
enum class JustifyContent { FlexStart, FlexEnd, Center, SpaceBetween, SpaceAround, SpaceEvenly };
enum class AlignItems { FlexStart, FlexEnd, Center, Stretch };
enum class AlignSelf { Auto, FlexStart, FlexEnd, Center, Stretch };
enum class AlignContent { FlexStart, FlexEnd, Center, SpaceBetween, SpaceAround, Stretch };
enum class BorderStyle { None, Single, Double, Thick, Dashed, Dotted, Ascii };

// Raw value of one inline style property.
using StyleValue = std::variant<double, std::string, std::vector<double>>;
using StyleMap = std::map<std::string, StyleValue>;

struct ViewportSize {
    int width = 0;
    int height = 0;
};

struct Dimension {
    enum class Unit { Auto, Cells, Percent, Vw, Vh, Ch };
    float value = 0;
    Unit unit = Unit::Auto;

    static Dimension auto_val() { return {0, Unit::Auto}; }
    static Dimension cells(float v) { return {v, Unit::Cells}; }
    static Dimension percent(float v) { return {v, Unit::Percent}; }
    static Dimension vw(float v) { return {v, Unit::Vw}; }
    static Dimension vh(float v) { return {v, Unit::Vh}; }

    bool is_auto() const { return unit == Unit::Auto; }

    // Whole cells, or nullopt when auto or when a percentage has no
    // definite reference size.
    std::optional<int> resolve(std::optional<int> reference, const ViewportSize& viewport) const;

    bool operator==(const Dimension& o) const { return value == o.value && unit == o.unit; }
};

// "10", "10px", "50%", "20vw", "5vh", "3ch", "auto".
std::optional<Dimension> parse_dimension(const std::string& text);

struct GridTemplate {
    std::vector<double> weights;  // array form
    std::string tokens;           // string form
    bool specified = false;
    bool is_array() const { return specified && tokens.empty(); }
};

struct GridAutoFlow {
    bool column = false;
    bool dense = false;
};

struct ComputedStyle {
    Display display = Display::Block;
    Position position = Position::Static;
    int z_index = 0;
    std::optional<Dimension> top, right, bottom, left;

    Dimension width, height;
    Dimension min_width, min_height;
    Dimension max_width, max_height;

    layout::EdgeSizes margin;
    layout::EdgeSizes padding;
    BorderStyle border_style = BorderStyle::None;
    std::string border_color;
    std::string color;
    std::string background_color;

    // Flexbox
    FlexDirection flex_direction = FlexDirection::Row;
    FlexWrap flex_wrap = FlexWrap::NoWrap;
    JustifyContent justify_content = JustifyContent::FlexStart;
    AlignItems align_items = AlignItems::Stretch;
    AlignSelf align_self = AlignSelf::Auto;
    AlignContent align_content = AlignContent::FlexStart;
    float flex_grow = 0;
    float flex_shrink = 1;
    std::optional<Dimension> flex_basis;
    int order = 0;
    int row_gap = 0;
    int column_gap = 0;

    // Grid
    GridTemplate grid_template_columns;
    GridTemplate grid_template_rows;
    GridAutoFlow grid_auto_flow;
    std::string grid_column;
    std::string grid_row;
    std::string grid_area;

    bool is_positioned() const { return position != Position::Static; }
    bool is_out_of_flow() const {
        return position == Position::Absolute || position == Position::Fixed;
    }
    bool is_row() const {
        return flex_direction == FlexDirection::Row || flex_direction == FlexDirection::RowReverse;
    }
    bool is_reverse() const {
        return flex_direction == FlexDirection::RowReverse ||
               flex_direction == FlexDirection::ColumnReverse;
    }
    layout::EdgeSizes border() const {
        int w = border_style == BorderStyle::None ? 0 : 1;
        return {w, w, w, w};
    }
};

} // namespace cellflow::style
