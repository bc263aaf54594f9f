#pragma once
#include <algorithm>
#include <optional>
#include <string>

namespace cellflow::tree { class Node; }

namespace cellflow::layout {

struct Rect {
    int x = 0, y = 0, width = 0, height = 0;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
    bool empty() const { return width <= 0 || height <= 0; }

    bool contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    bool intersects(const Rect& other) const {
        return !(other.x + other.width <= x || x + width <= other.x ||
                 other.y + other.height <= y || y + height <= other.y);
    }

    // Empty rectangle at the origin when the two do not overlap.
    Rect intersect(const Rect& other) const {
        if (!intersects(other)) return {};
        int nx = std::max(x, other.x);
        int ny = std::max(y, other.y);
        return {nx, ny, std::min(right(), other.right()) - nx,
                std::min(bottom(), other.bottom()) - ny};
    }

    Rect translated(int dx, int dy) const { return {x + dx, y + dy, width, height}; }

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

struct EdgeSizes {
    int top = 0, right = 0, bottom = 0, left = 0;

    int horizontal() const { return left + right; }
    int vertical() const { return top + bottom; }

    bool operator==(const EdgeSizes& o) const {
        return top == o.top && right == o.right && bottom == o.bottom && left == o.left;
    }
};

// Unset fields mean the axis is unbounded.
struct LayoutConstraints {
    std::optional<int> max_width;
    std::optional<int> max_height;
    std::optional<int> available_width;
    std::optional<int> available_height;

    static LayoutConstraints bounded(int width, int height) {
        return {width, height, width, height};
    }
};

std::string to_string(const LayoutConstraints& constraints);

struct Size {
    int width = 0;
    int height = 0;
};

struct Dimensions {
    int width = 0;
    int height = 0;
    int content_width = 0;
    int content_height = 0;
};

// Position is relative to the parent's content-box origin.
struct ChildLayout {
    tree::Node* node = nullptr;
    Rect bounds;
};

} // namespace cellflow::layout
