#include <cellflow/style/style_resolver.h>
#include <cellflow/core/diagnostics.h>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace cellflow::style {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (iss >> part) parts.push_back(part);
    return parts;
}

std::optional<double> parse_number(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<double> as_number(const StyleValue& value) {
    if (auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) return std::nullopt;
        return *d;
    }
    if (auto* s = std::get_if<std::string>(&value)) return parse_number(*s);
    return std::nullopt;
}

std::optional<std::string> as_keyword(const StyleValue& value) {
    if (auto* s = std::get_if<std::string>(&value)) return trim(*s);
    return std::nullopt;
}

std::optional<Dimension> as_dimension(const StyleValue& value) {
    if (auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) return std::nullopt;
        return Dimension::cells(static_cast<float>(*d));
    }
    if (auto* s = std::get_if<std::string>(&value)) return parse_dimension(*s);
    return std::nullopt;
}

int clamp_to_int(double v) {
    if (v > 1e6) return 1000000;
    if (v < -1e6) return -1000000;
    return static_cast<int>(std::floor(v));
}

template<typename Enum, size_t N>
std::optional<Enum> lookup(const std::pair<const char*, Enum> (&table)[N], const std::string& key) {
    for (const auto& [name, value] : table) {
        if (key == name) return value;
    }
    return std::nullopt;
}

const std::pair<const char*, Display> kDisplay[] = {
    {"block", Display::Block}, {"flex", Display::Flex},
    {"grid", Display::Grid}, {"none", Display::None},
};
const std::pair<const char*, Position> kPosition[] = {
    {"static", Position::Static}, {"relative", Position::Relative},
    {"absolute", Position::Absolute}, {"fixed", Position::Fixed},
    {"sticky", Position::Sticky},
};
const std::pair<const char*, FlexDirection> kFlexDirection[] = {
    {"row", FlexDirection::Row}, {"row-reverse", FlexDirection::RowReverse},
    {"column", FlexDirection::Column}, {"column-reverse", FlexDirection::ColumnReverse},
};
const std::pair<const char*, FlexWrap> kFlexWrap[] = {
    {"nowrap", FlexWrap::NoWrap}, {"wrap", FlexWrap::Wrap},
    {"wrap-reverse", FlexWrap::WrapReverse},
};
const std::pair<const char*, JustifyContent> kJustify[] = {
    {"flex-start", JustifyContent::FlexStart}, {"flex-end", JustifyContent::FlexEnd},
    {"center", JustifyContent::Center}, {"space-between", JustifyContent::SpaceBetween},
    {"space-around", JustifyContent::SpaceAround}, {"space-evenly", JustifyContent::SpaceEvenly},
};
const std::pair<const char*, AlignItems> kAlignItems[] = {
    {"flex-start", AlignItems::FlexStart}, {"flex-end", AlignItems::FlexEnd},
    {"center", AlignItems::Center}, {"stretch", AlignItems::Stretch},
};
const std::pair<const char*, AlignSelf> kAlignSelf[] = {
    {"auto", AlignSelf::Auto}, {"flex-start", AlignSelf::FlexStart},
    {"flex-end", AlignSelf::FlexEnd}, {"center", AlignSelf::Center},
    {"stretch", AlignSelf::Stretch},
};
const std::pair<const char*, AlignContent> kAlignContent[] = {
    {"flex-start", AlignContent::FlexStart}, {"flex-end", AlignContent::FlexEnd},
    {"center", AlignContent::Center}, {"space-between", AlignContent::SpaceBetween},
    {"space-around", AlignContent::SpaceAround}, {"stretch", AlignContent::Stretch},
};
const std::pair<const char*, BorderStyle> kBorderStyle[] = {
    {"none", BorderStyle::None}, {"single", BorderStyle::Single},
    {"solid", BorderStyle::Single}, {"double", BorderStyle::Double},
    {"thick", BorderStyle::Thick}, {"dashed", BorderStyle::Dashed},
    {"dotted", BorderStyle::Dotted}, {"ascii", BorderStyle::Ascii},
};

// CSS 1-4 value edge shorthand.
std::optional<layout::EdgeSizes> parse_edges(const StyleValue& value) {
    if (auto n = as_number(value)) {
        int v = clamp_to_int(*n);
        return layout::EdgeSizes{v, v, v, v};
    }
    auto* s = std::get_if<std::string>(&value);
    if (!s) return std::nullopt;
    auto parts = split_ws(*s);
    std::vector<int> v;
    for (auto& p : parts) {
        auto d = parse_dimension(p);
        if (!d || d->unit != Dimension::Unit::Cells) return std::nullopt;
        v.push_back(static_cast<int>(d->value));
    }
    switch (v.size()) {
        case 1: return layout::EdgeSizes{v[0], v[0], v[0], v[0]};
        case 2: return layout::EdgeSizes{v[0], v[1], v[0], v[1]};
        case 3: return layout::EdgeSizes{v[0], v[1], v[2], v[1]};
        case 4: return layout::EdgeSizes{v[0], v[1], v[2], v[3]};
        default: return std::nullopt;
    }
}

// Returns true when `name` is one of the per-edge variants of `base`.
bool apply_edge_property(layout::EdgeSizes& edges, const std::string& base,
                         const std::string& name, int v) {
    if (name == base + "Top") { edges.top = v; return true; }
    if (name == base + "Right") { edges.right = v; return true; }
    if (name == base + "Bottom") { edges.bottom = v; return true; }
    if (name == base + "Left") { edges.left = v; return true; }
    if (name == base + "Horizontal") { edges.left = edges.right = v; return true; }
    if (name == base + "Vertical") { edges.top = edges.bottom = v; return true; }
    return false;
}

// Shorthands apply before their longhands so "marginTop" refines
// "margin" whatever order the map iterates in.
int property_rank(const std::string& name) {
    if (name == "margin" || name == "padding" || name == "flex" || name == "gap") return 0;
    return 1;
}

} // namespace

std::optional<int> Dimension::resolve(std::optional<int> reference,
                                      const ViewportSize& viewport) const {
    switch (unit) {
        case Unit::Auto:
            return std::nullopt;
        case Unit::Cells:
        case Unit::Ch:
            return static_cast<int>(std::floor(value));
        case Unit::Percent:
            if (!reference) return std::nullopt;
            return static_cast<int>(std::floor(*reference * value / 100.0f));
        case Unit::Vw:
            return static_cast<int>(std::floor(viewport.width * value / 100.0f));
        case Unit::Vh:
            return static_cast<int>(std::floor(viewport.height * value / 100.0f));
    }
    return std::nullopt;
}

std::optional<Dimension> parse_dimension(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    if (t == "auto") return Dimension::auto_val();

    struct Suffix { const char* text; Dimension::Unit unit; };
    static const Suffix kSuffixes[] = {
        {"px", Dimension::Unit::Cells}, {"%", Dimension::Unit::Percent},
        {"vw", Dimension::Unit::Vw},    {"vh", Dimension::Unit::Vh},
        {"ch", Dimension::Unit::Ch},
    };
    for (const auto& suffix : kSuffixes) {
        std::string_view sv(suffix.text);
        if (t.size() > sv.size() && t.ends_with(sv)) {
            auto n = parse_number(t.substr(0, t.size() - sv.size()));
            if (!n) return std::nullopt;
            return Dimension{static_cast<float>(*n), suffix.unit};
        }
    }
    auto n = parse_number(t);
    if (!n) return std::nullopt;
    return Dimension::cells(static_cast<float>(*n));
}

std::string style_value_to_string(const StyleValue& value) {
    if (auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    std::ostringstream oss;
    oss << "[";
    const auto& arr = std::get<std::vector<double>>(value);
    for (size_t i = 0; i < arr.size(); ++i) {
        if (i) oss << ",";
        oss << arr[i];
    }
    oss << "]";
    return oss.str();
}

ComputedStyle StyleResolver::resolve(const StyleMap& inline_style, const StyleMap& defaults) const {
    StyleMap merged = defaults;
    for (const auto& [name, value] : inline_style) {
        merged[name] = value;
    }

    ComputedStyle style;
    for (int rank = 0; rank < 2; ++rank) {
        for (const auto& [name, value] : merged) {
            if (property_rank(name) == rank) {
                apply_property(style, name, value);
            }
        }
    }
    return style;
}

void StyleResolver::report_malformed(const std::string& name, const std::string& detail) const {
    if (!diagnostics_) return;
    diagnostics_->warning("style", "resolve",
                          std::string(core::error_kind_name(core::ErrorKind::MalformedStyle)) +
                              ": " + name + " = " + detail);
}

void StyleResolver::apply_property(ComputedStyle& style, const std::string& name,
                                   const StyleValue& value) const {
    auto keyword = as_keyword(value);

    auto keyword_prop = [&](auto& field, const auto& table) {
        if (keyword) {
            if (auto v = lookup(table, *keyword)) {
                field = *v;
                return;
            }
        }
        report_malformed(name, style_value_to_string(value));
    };
    auto dimension_prop = [&](Dimension& field) {
        if (auto d = as_dimension(value)) {
            field = *d;
        } else {
            report_malformed(name, style_value_to_string(value));
        }
    };
    auto optional_dimension_prop = [&](std::optional<Dimension>& field) {
        if (auto d = as_dimension(value)) {
            if (d->is_auto()) field.reset(); else field = *d;
        } else {
            report_malformed(name, style_value_to_string(value));
        }
    };
    auto int_prop = [&](int& field, bool allow_negative) {
        auto n = as_number(value);
        if (!n || (!allow_negative && *n < 0)) {
            report_malformed(name, style_value_to_string(value));
            return;
        }
        field = clamp_to_int(*n);
    };
    auto float_prop = [&](float& field) {
        auto n = as_number(value);
        if (!n || *n < 0) {
            report_malformed(name, style_value_to_string(value));
            return;
        }
        field = static_cast<float>(*n);
    };
    auto grid_template_prop = [&](GridTemplate& field) {
        GridTemplate t;
        t.specified = true;
        if (auto* arr = std::get_if<std::vector<double>>(&value)) {
            t.weights = *arr;
        } else if (auto* s = std::get_if<std::string>(&value)) {
            t.tokens = trim(*s);
            if (t.tokens.empty()) t.specified = false;
        } else {
            t.weights.push_back(std::get<double>(value));
        }
        field = std::move(t);
    };

    if (name == "display") keyword_prop(style.display, kDisplay);
    else if (name == "position") keyword_prop(style.position, kPosition);
    else if (name == "zIndex") {
        if (keyword && *keyword == "auto") style.z_index = 0;
        else int_prop(style.z_index, true);
    }
    else if (name == "top") optional_dimension_prop(style.top);
    else if (name == "right") optional_dimension_prop(style.right);
    else if (name == "bottom") optional_dimension_prop(style.bottom);
    else if (name == "left") optional_dimension_prop(style.left);
    else if (name == "width") dimension_prop(style.width);
    else if (name == "height") dimension_prop(style.height);
    else if (name == "minWidth") dimension_prop(style.min_width);
    else if (name == "minHeight") dimension_prop(style.min_height);
    else if (name == "maxWidth") dimension_prop(style.max_width);
    else if (name == "maxHeight") dimension_prop(style.max_height);
    else if (name == "margin" || name == "padding") {
        auto edges = parse_edges(value);
        if (edges) {
            (name == "margin" ? style.margin : style.padding) = *edges;
        } else {
            report_malformed(name, style_value_to_string(value));
        }
    }
    else if (name.starts_with("margin") || name.starts_with("padding")) {
        bool is_margin = name.starts_with("margin");
        auto n = as_number(value);
        if (!n) {
            report_malformed(name, style_value_to_string(value));
            return;
        }
        auto& edges = is_margin ? style.margin : style.padding;
        if (!apply_edge_property(edges, is_margin ? "margin" : "padding", name, clamp_to_int(*n))) {
            report_malformed(name, "unknown property");
        }
    }
    else if (name == "borderStyle") keyword_prop(style.border_style, kBorderStyle);
    else if (name == "borderColor") { if (keyword) style.border_color = *keyword; }
    else if (name == "color") { if (keyword) style.color = *keyword; }
    else if (name == "backgroundColor") { if (keyword) style.background_color = *keyword; }
    else if (name == "flexDirection") keyword_prop(style.flex_direction, kFlexDirection);
    else if (name == "flexWrap") keyword_prop(style.flex_wrap, kFlexWrap);
    else if (name == "justifyContent") keyword_prop(style.justify_content, kJustify);
    else if (name == "alignItems") keyword_prop(style.align_items, kAlignItems);
    else if (name == "alignSelf") keyword_prop(style.align_self, kAlignSelf);
    else if (name == "alignContent") keyword_prop(style.align_content, kAlignContent);
    else if (name == "flex") {
        if (auto n = as_number(value)) {
            if (*n >= 0) style.flex_grow = static_cast<float>(*n);
            else report_malformed(name, style_value_to_string(value));
        } else if (keyword && *keyword == "none") {
            style.flex_grow = 0;
            style.flex_shrink = 0;
        } else if (keyword && *keyword == "auto") {
            style.flex_grow = 1;
            style.flex_shrink = 1;
        } else if (keyword) {
            auto parts = split_ws(*keyword);
            auto grow = parts.size() >= 1 ? parse_number(parts[0]) : std::nullopt;
            auto shrink = parts.size() >= 2 ? parse_number(parts[1]) : std::optional<double>(1.0);
            std::optional<Dimension> basis;
            if (parts.size() >= 3) basis = parse_dimension(parts[2]);
            if (!grow || !shrink || *grow < 0 || *shrink < 0 ||
                parts.size() > 3 || (parts.size() == 3 && !basis)) {
                report_malformed(name, *keyword);
                return;
            }
            style.flex_grow = static_cast<float>(*grow);
            style.flex_shrink = static_cast<float>(*shrink);
            if (basis && !basis->is_auto()) style.flex_basis = basis;
        } else {
            report_malformed(name, style_value_to_string(value));
        }
    }
    else if (name == "flexGrow") float_prop(style.flex_grow);
    else if (name == "flexShrink") float_prop(style.flex_shrink);
    else if (name == "flexBasis") optional_dimension_prop(style.flex_basis);
    else if (name == "order") int_prop(style.order, true);
    else if (name == "gap") {
        if (auto n = as_number(value); n && *n >= 0) {
            style.row_gap = style.column_gap = clamp_to_int(*n);
        } else if (keyword) {
            auto parts = split_ws(*keyword);
            auto r = parts.size() == 2 ? parse_number(parts[0]) : std::nullopt;
            auto c = parts.size() == 2 ? parse_number(parts[1]) : std::nullopt;
            if (r && c && *r >= 0 && *c >= 0) {
                style.row_gap = clamp_to_int(*r);
                style.column_gap = clamp_to_int(*c);
            } else {
                report_malformed(name, *keyword);
            }
        } else {
            report_malformed(name, style_value_to_string(value));
        }
    }
    else if (name == "rowGap") int_prop(style.row_gap, false);
    else if (name == "columnGap") int_prop(style.column_gap, false);
    else if (name == "gridTemplateColumns") grid_template_prop(style.grid_template_columns);
    else if (name == "gridTemplateRows") grid_template_prop(style.grid_template_rows);
    else if (name == "gridAutoFlow") {
        auto parts = keyword ? split_ws(*keyword) : std::vector<std::string>{};
        GridAutoFlow flow;
        bool ok = !parts.empty() && parts.size() <= 2;
        for (auto& p : parts) {
            if (p == "row") flow.column = false;
            else if (p == "column") flow.column = true;
            else if (p == "dense") flow.dense = true;
            else ok = false;
        }
        if (ok) style.grid_auto_flow = flow;
        else report_malformed(name, style_value_to_string(value));
    }
    else if (name == "gridColumn") style.grid_column = style_value_to_string(value);
    else if (name == "gridRow") style.grid_row = style_value_to_string(value);
    else if (name == "gridArea") style.grid_area = style_value_to_string(value);
}

} // namespace cellflow::style
