#include <cellflow/layout/box.h>

namespace cellflow::layout {

namespace {

std::string axis_pair(const std::optional<int>& w, const std::optional<int>& h) {
    auto part = [](const std::optional<int>& v) {
        return v ? std::to_string(*v) : std::string("inf");
    };
    return part(w) + "x" + part(h);
}

} // namespace

std::string to_string(const LayoutConstraints& constraints) {
    return "max=" + axis_pair(constraints.max_width, constraints.max_height) +
           " avail=" + axis_pair(constraints.available_width, constraints.available_height);
}

} // namespace cellflow::layout
