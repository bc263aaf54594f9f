#include <cellflow/layout/grid.h>
#include <cellflow/core/config.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace cellflow::layout {

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

std::vector<std::string> split_slash(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        parts.push_back(trim(s.substr(start, slash - start)));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return parts;
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<double> parse_integral(const std::string& text) {
    auto v = parse_number(text);
    if (!v || *v != std::floor(*v)) return std::nullopt;
    return v;
}

std::optional<int> parse_int(const std::string& text) {
    auto v = parse_integral(text);
    if (!v || *v < INT_MIN || *v > INT_MAX) return std::nullopt;
    return static_cast<int>(*v);
}

// Integral value limited to [-limit, limit]; `clamped` is set when the
// text named something further out.
std::optional<int> parse_bounded(const std::string& text, int limit, bool& clamped) {
    auto v = parse_integral(text);
    if (!v) return std::nullopt;
    if (*v > limit || *v < -limit) {
        clamped = true;
        return *v > 0 ? limit : -limit;
    }
    return static_cast<int>(*v);
}

std::optional<GridTrack> parse_track(const std::string& word) {
    if (word == "auto") return GridTrack::fraction(1);
    if (word.ends_with("fr")) {
        auto v = parse_number(word.substr(0, word.size() - 2));
        if (!v || *v < 0) return std::nullopt;
        return GridTrack::fraction(*v);
    }
    std::string digits = word.ends_with("px") ? word.substr(0, word.size() - 2) : word;
    auto v = parse_number(digits);
    if (!v || *v < 0) return std::nullopt;
    return GridTrack::fixed(*v);
}

// Index of the ')' closing the '(' at `open`, or npos.
size_t matching_paren(const std::string& text, size_t open) {
    int level = 0;
    for (size_t i = open; i < text.size(); ++i) {
        if (text[i] == '(') ++level;
        else if (text[i] == ')' && --level == 0) return i;
    }
    return std::string::npos;
}

bool parse_tokens(const std::string& text, GridTrackList& out) {
    size_t i = 0;
    while (i < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        if (text[i] == '[') {
            size_t close = text.find(']', i);
            if (close == std::string::npos) return false;
            int line = static_cast<int>(out.tracks.size()) + 1;
            for (auto& name : split_ws(text.substr(i + 1, close - i - 1))) {
                out.line_names[name].push_back(line);
            }
            i = close + 1;
            continue;
        }

        if (text.compare(i, 7, "repeat(") == 0) {
            size_t open = i + 6;
            size_t close = matching_paren(text, open);
            if (close == std::string::npos) return false;
            std::string inner = text.substr(open + 1, close - open - 1);
            size_t comma = inner.find(',');
            if (comma == std::string::npos) return false;
            auto count = parse_int(trim(inner.substr(0, comma)));
            if (!count || *count < 1 || *count > core::config::kMaxGridRepeat) return false;
            std::string body = inner.substr(comma + 1);
            for (int k = 0; k < *count; ++k) {
                if (!parse_tokens(body, out)) return false;
            }
            i = close + 1;
            continue;
        }

        size_t end = i;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])) &&
               text[end] != '[') {
            ++end;
        }
        auto track = parse_track(text.substr(i, end - i));
        if (!track) return false;
        out.tracks.push_back(*track);
        i = end;
    }
    return true;
}

// One side of a placement: a line, a span, or nothing.
struct LineRef {
    std::optional<int> line;  // 1-based
    std::optional<int> span;
    bool clamped = false;
};

LineRef parse_line_ref(const std::string& text, const GridTrackList& axis) {
    LineRef ref;
    if (text.empty() || text == "auto") return ref;

    constexpr int limit = core::config::kMaxGridLine;
    auto words = split_ws(text);
    if (words.size() == 2 && words[0] == "span") {
        auto n = parse_bounded(words[1], limit, ref.clamped);
        if (n && *n > 0) ref.span = *n;
        return ref;
    }

    if (auto n = parse_bounded(text, limit, ref.clamped)) {
        if (*n > 0) {
            ref.line = *n;
        } else if (*n < 0) {
            int line_count = static_cast<int>(axis.tracks.size()) + 1;
            ref.line = std::max(1, line_count + 1 + *n);
        }
        return ref;
    }

    ref.line = axis.find_line(text);
    return ref;
}

} // namespace

std::optional<int> GridTrackList::find_line(const std::string& name) const {
    auto it = line_names.find(name);
    if (it == line_names.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

GridTrackList parse_grid_template(const style::GridTemplate& tmpl) {
    GridTrackList list;
    if (!tmpl.specified) return list;

    if (tmpl.is_array()) {
        for (double w : tmpl.weights) {
            list.tracks.push_back(GridTrack::fraction(std::max(0.0, w)));
        }
        return list;
    }

    if (parse_tokens(tmpl.tokens, list) && !list.tracks.empty()) {
        return list;
    }

    GridTrackList fallback;
    fallback.valid = false;
    size_t count = std::max<size_t>(1, split_ws(tmpl.tokens).size());
    fallback.tracks.assign(count, GridTrack::fraction(1));
    return fallback;
}

std::vector<int> size_grid_tracks(const std::vector<GridTrack>& tracks, int available, int gap) {
    std::vector<int> sizes(tracks.size(), 0);
    if (tracks.empty()) return sizes;

    double fixed = 0;
    double total_weight = 0;
    for (auto& t : tracks) {
        if (t.is_fraction()) total_weight += t.value;
        else fixed += std::floor(t.value);
    }
    double gaps = static_cast<double>(gap) * (static_cast<int>(tracks.size()) - 1);
    double remaining = std::max(0.0, available - fixed - gaps);

    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto& t = tracks[i];
        if (!t.is_fraction()) {
            sizes[i] = static_cast<int>(std::floor(t.value));
        } else if (total_weight > 0) {
            sizes[i] = static_cast<int>(std::floor(remaining * t.value / total_weight));
        }
    }
    return sizes;
}

GridSpan parse_grid_span(const std::string& text, const GridTrackList& axis) {
    GridSpan result;
    auto parts = split_slash(trim(text));
    LineRef first = parse_line_ref(parts[0], axis);
    LineRef second = parts.size() > 1 ? parse_line_ref(parts[1], axis) : LineRef{};
    result.clamped = first.clamped || second.clamped;

    if (first.line && second.line) {
        int a = std::min(*first.line, *second.line);
        int b = std::max(*first.line, *second.line);
        result.start = a - 1;
        result.span = std::max(1, b - a);
    } else if (first.line) {
        result.start = *first.line - 1;
        result.span = second.span.value_or(1);
    } else if (second.line) {
        result.span = first.span.value_or(1);
        result.start = std::max(0, *second.line - 1 - result.span);
    } else {
        result.span = first.span.value_or(second.span.value_or(1));
    }
    return result;
}

void parse_grid_area(const std::string& text, const GridTrackList& rows,
                     const GridTrackList& columns, GridSpan& row, GridSpan& column) {
    auto parts = split_slash(trim(text));
    auto axis_text = [&](size_t start, size_t end) {
        std::string s = start < parts.size() ? parts[start] : "";
        if (end < parts.size() && !parts[end].empty()) s += " / " + parts[end];
        return s;
    };
    row = parse_grid_span(axis_text(0, 2), rows);
    column = parse_grid_span(axis_text(1, 3), columns);
}

} // namespace cellflow::layout
