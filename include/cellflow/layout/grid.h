#pragma once
#include <cellflow/style/computed_style.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cellflow::layout {

struct GridTrack {
    enum class Kind { Fixed, Fraction };
    Kind kind = Kind::Fraction;
    double value = 1;

    static GridTrack fixed(double cells) { return {Kind::Fixed, cells}; }
    static GridTrack fraction(double weight) { return {Kind::Fraction, weight}; }
    bool is_fraction() const { return kind == Kind::Fraction; }
};

struct GridTrackList {
    std::vector<GridTrack> tracks;
    // Line name -> 1-based line numbers, in template order.
    std::map<std::string, std::vector<int>> line_names;
    // False when the template could not be parsed and equal tracks were
    // substituted.
    bool valid = true;

    std::optional<int> find_line(const std::string& name) const;
};

// Accepts a weight array or a token string of `N`, `Npx`, `Nfr`, `auto`,
// `[name ...]` and `repeat(N, ...)`. `auto` counts as 1fr. An unparseable
// string yields one equal track per whitespace-separated token.
GridTrackList parse_grid_template(const style::GridTemplate& tmpl);

// Sizes of `tracks` laid out in `available` cells with `gap` between
// them. Fractions share what the fixed tracks and gaps leave, floored.
std::vector<int> size_grid_tracks(const std::vector<GridTrack>& tracks, int available, int gap);

// One axis of an item's placement. `start` is a 0-based track index
// when the item names a line, nullopt for auto placement.
struct GridSpan {
    std::optional<int> start;
    int span = 1;
    // A line number or span exceeded kMaxGridLine and was clamped.
    bool clamped = false;
};

// Parses "3", "-1", "2 / 4", "span 2", "a / b", "2 / span 3" against
// the named lines of one axis. Negative numbers count back from the last
// line of `axis`. Unknown names leave the axis auto-placed.
GridSpan parse_grid_span(const std::string& text, const GridTrackList& axis);

// "row-start / col-start / row-end / col-end"; missing parts stay auto.
void parse_grid_area(const std::string& text, const GridTrackList& rows,
                     const GridTrackList& columns, GridSpan& row, GridSpan& column);

} // namespace cellflow::layout
