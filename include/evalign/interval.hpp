#pragma once

#include "types.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace evalign {

// ============================================================================
// Interval arithmetic shared by all matchers
// ============================================================================

inline double duration(const Event& e) {
    return e.end - e.start;
}

// Length of the intersection of two intervals, 0 if disjoint
inline double overlap_duration(const Event& a, const Event& b) {
    const double lo = std::max(a.start, b.start);
    const double hi = std::min(a.end, b.end);
    return std::max(0.0, hi - lo);
}

// Touching intervals overlap by 0, so min_overlap = 0 links them
inline bool overlaps_with(const Event& a, const Event& b, double min_overlap) {
    return overlap_duration(a, b) >= min_overlap;
}

// Intersection over union of two intervals; 0 for a degenerate union
inline double temporal_iou(const Event& a, const Event& b) {
    const double inter = overlap_duration(a, b);
    const double uni = duration(a) + duration(b) - inter;
    if (uni <= 0.0) return 0.0;
    return inter / uni;
}

// (min start, max end) over all events, (0, 0) when empty
inline std::pair<double, double> time_range(const std::vector<Event>& events) {
    if (events.empty()) return {0.0, 0.0};
    double lo = events.front().start;
    double hi = events.front().end;
    for (const auto& e : events) {
        lo = std::min(lo, e.start);
        hi = std::max(hi, e.end);
    }
    return {lo, hi};
}

}  // namespace evalign
