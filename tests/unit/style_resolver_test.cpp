#include <gtest/gtest.h>
#include <cellflow/core/diagnostics.h>
#include <cellflow/style/style_resolver.h>

#include <string>
#include <vector>

using namespace cellflow;
using namespace cellflow::style;

namespace {

ComputedStyle resolve(const StyleMap& styles, core::DiagnosticEmitter* diagnostics = nullptr) {
    StyleResolver resolver;
    resolver.set_diagnostics(diagnostics);
    return resolver.resolve(styles);
}

} // namespace

// 1. Unset properties take their defaults
TEST(StyleResolverTest, Defaults) {
    auto cs = resolve({});
    EXPECT_EQ(cs.display, Display::Block);
    EXPECT_EQ(cs.position, Position::Static);
    EXPECT_TRUE(cs.width.is_auto());
    EXPECT_EQ(cs.flex_direction, FlexDirection::Row);
    EXPECT_EQ(cs.flex_wrap, FlexWrap::NoWrap);
    EXPECT_EQ(cs.align_items, AlignItems::Stretch);
    EXPECT_EQ(cs.align_content, AlignContent::FlexStart);
    EXPECT_FLOAT_EQ(cs.flex_grow, 0);
    EXPECT_FLOAT_EQ(cs.flex_shrink, 1);
    EXPECT_FALSE(cs.grid_template_columns.specified);
}

// 2. Keyword properties
TEST(StyleResolverTest, Keywords) {
    auto cs = resolve({{"display", std::string("grid")},
                       {"position", std::string("absolute")},
                       {"flexDirection", std::string("column-reverse")},
                       {"justifyContent", std::string("space-evenly")},
                       {"borderStyle", std::string("solid")}});
    EXPECT_EQ(cs.display, Display::Grid);
    EXPECT_EQ(cs.position, Position::Absolute);
    EXPECT_EQ(cs.flex_direction, FlexDirection::ColumnReverse);
    EXPECT_TRUE(cs.is_reverse());
    EXPECT_FALSE(cs.is_row());
    EXPECT_EQ(cs.justify_content, JustifyContent::SpaceEvenly);
    EXPECT_EQ(cs.border_style, BorderStyle::Single);
    EXPECT_EQ(cs.border().left, 1);
}

// 3. Dimensions with and without units
TEST(StyleResolverTest, Dimensions) {
    auto cs = resolve({{"width", 12.0}, {"height", std::string("50%")},
                       {"minWidth", std::string("3px")}, {"maxHeight", std::string("20vh")}});
    EXPECT_EQ(cs.width, Dimension::cells(12));
    EXPECT_EQ(cs.height, Dimension::percent(50));
    EXPECT_EQ(cs.min_width, Dimension::cells(3));
    EXPECT_EQ(cs.max_height, Dimension::vh(20));
}

// 4. Dimension resolution
TEST(StyleResolverTest, DimensionResolve) {
    ViewportSize viewport{100, 40};
    EXPECT_EQ(Dimension::cells(7.9f).resolve(std::nullopt, viewport), 7);
    EXPECT_EQ(Dimension::percent(50).resolve(30, viewport), 15);
    EXPECT_FALSE(Dimension::percent(50).resolve(std::nullopt, viewport).has_value());
    EXPECT_EQ(Dimension::vw(10).resolve(std::nullopt, viewport), 10);
    EXPECT_EQ(Dimension::vh(25).resolve(std::nullopt, viewport), 10);
    EXPECT_FALSE(Dimension::auto_val().resolve(50, viewport).has_value());
}

// 5. Edge shorthands expand like CSS; longhands refine them
TEST(StyleResolverTest, EdgeShorthands) {
    auto two = resolve({{"padding", std::string("1 2")}});
    EXPECT_EQ(two.padding, (layout::EdgeSizes{1, 2, 1, 2}));

    auto four = resolve({{"margin", std::string("1 2 3 4")}});
    EXPECT_EQ(four.margin, (layout::EdgeSizes{1, 2, 3, 4}));

    auto refined = resolve({{"marginTop", 5.0}, {"margin", 1.0}});
    EXPECT_EQ(refined.margin, (layout::EdgeSizes{5, 1, 1, 1}));

    auto axes = resolve({{"paddingHorizontal", 2.0}, {"paddingVertical", 1.0}});
    EXPECT_EQ(axes.padding, (layout::EdgeSizes{1, 2, 1, 2}));
}

// 6. flex and gap shorthands
TEST(StyleResolverTest, FlexAndGapShorthands) {
    auto grow_only = resolve({{"flex", 2.0}});
    EXPECT_FLOAT_EQ(grow_only.flex_grow, 2);

    auto full = resolve({{"flex", std::string("1 0 10")}});
    EXPECT_FLOAT_EQ(full.flex_grow, 1);
    EXPECT_FLOAT_EQ(full.flex_shrink, 0);
    ASSERT_TRUE(full.flex_basis.has_value());
    EXPECT_EQ(*full.flex_basis, Dimension::cells(10));

    auto none = resolve({{"flex", std::string("none")}});
    EXPECT_FLOAT_EQ(none.flex_shrink, 0);

    auto gaps = resolve({{"gap", std::string("1 3")}});
    EXPECT_EQ(gaps.row_gap, 1);
    EXPECT_EQ(gaps.column_gap, 3);
}

// 7. Grid properties
TEST(StyleResolverTest, GridProperties) {
    auto cs = resolve({{"gridTemplateColumns", std::vector<double>{1, 2}},
                       {"gridTemplateRows", std::string("3 1fr")},
                       {"gridAutoFlow", std::string("column dense")},
                       {"gridColumn", 2.0}});
    EXPECT_TRUE(cs.grid_template_columns.is_array());
    EXPECT_EQ(cs.grid_template_columns.weights.size(), 2u);
    EXPECT_FALSE(cs.grid_template_rows.is_array());
    EXPECT_EQ(cs.grid_template_rows.tokens, "3 1fr");
    EXPECT_TRUE(cs.grid_auto_flow.column);
    EXPECT_TRUE(cs.grid_auto_flow.dense);
    EXPECT_EQ(cs.grid_column, "2");
}

// 8. Inline values override defaults
TEST(StyleResolverTest, InlineOverridesDefaults) {
    StyleResolver resolver;
    auto cs = resolver.resolve({{"flexDirection", std::string("row")}},
                               {{"display", std::string("flex")},
                                {"flexDirection", std::string("column")}});
    EXPECT_EQ(cs.display, Display::Flex);
    EXPECT_EQ(cs.flex_direction, FlexDirection::Row);
}

// 9. Malformed values fall back to defaults and warn
TEST(StyleResolverTest, MalformedValuesWarn) {
    core::DiagnosticEmitter diagnostics;
    auto cs = resolve({{"display", std::string("table")},
                       {"width", std::string("wide")},
                       {"flexGrow", -1.0},
                       {"rowGap", -2.0}},
                      &diagnostics);

    EXPECT_EQ(cs.display, Display::Block);
    EXPECT_TRUE(cs.width.is_auto());
    EXPECT_FLOAT_EQ(cs.flex_grow, 0);
    EXPECT_EQ(cs.row_gap, 0);

    auto warnings = diagnostics.events_by_module("style");
    ASSERT_EQ(warnings.size(), 4u);
    for (const auto& w : warnings) {
        EXPECT_EQ(w.severity, core::Severity::Warning);
        EXPECT_EQ(w.stage, "resolve");
        EXPECT_EQ(w.message.rfind("malformed-style: ", 0), 0u);
    }
}

// 10. Without an emitter malformed values are still tolerated
TEST(StyleResolverTest, MalformedWithoutDiagnostics) {
    auto cs = resolve({{"alignItems", std::string("sideways")}});
    EXPECT_EQ(cs.align_items, AlignItems::Stretch);
}

// 11. parse_dimension
TEST(StyleResolverTest, ParseDimension) {
    EXPECT_EQ(parse_dimension("auto"), Dimension::auto_val());
    EXPECT_EQ(parse_dimension(" 4 "), Dimension::cells(4));
    EXPECT_EQ(parse_dimension("30vw"), Dimension::vw(30));
    EXPECT_FALSE(parse_dimension("px").has_value());
    EXPECT_FALSE(parse_dimension("").has_value());
    EXPECT_FALSE(parse_dimension("1e400").has_value());
}

// 12. Value formatting used in diagnostics
TEST(StyleResolverTest, StyleValueToString) {
    EXPECT_EQ(style_value_to_string(3.0), "3");
    EXPECT_EQ(style_value_to_string(std::string("flex")), "flex");
    EXPECT_EQ(style_value_to_string(std::vector<double>{1, 2.5}), "[1,2.5]");
}
