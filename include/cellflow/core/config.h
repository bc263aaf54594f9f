#ifndef CELLFLOW_CORE_CONFIG_H
#define CELLFLOW_CORE_CONFIG_H

#include <climits>
#include <cstdint>

namespace cellflow::core::config {

// Fallback viewport when the host has not sized the buffer.
inline constexpr int kDefaultColumns = 80;
inline constexpr int kDefaultRows = 24;

inline constexpr const char kRootLayerId[] = "root";
inline constexpr int kEmptyCellDepth = INT_MIN;

// Scroll view defaults.
inline constexpr int kDefaultScrollStep = 1;
inline constexpr int kAutoScrollTolerance = 1;
inline constexpr const char kScrollbarTrackChar[] = "│";
inline constexpr const char kScrollbarHTrackChar[] = "─";
inline constexpr const char kScrollbarThumbChar[] = "█";
inline constexpr const char kScrollbarTrackColor[] = "#333333";
inline constexpr const char kScrollbarThumbColor[] = "#888888";
inline constexpr const char kScrollUpIndicator[] = "↑";
inline constexpr const char kScrollDownIndicator[] = "↓";
inline constexpr const char kScrollLeftIndicator[] = "←";
inline constexpr const char kScrollRightIndicator[] = "→";

// Grid containers without a column template.
inline constexpr int kMaxAutoGridColumns = 3;
// Upper bound for repeat() counts.
inline constexpr int kMaxGridRepeat = 1000;
// Grid line numbers and spans beyond this are clamped to it.
inline constexpr int kMaxGridLine = 1000;

}  // namespace cellflow::core::config

#endif  // CELLFLOW_CORE_CONFIG_H
