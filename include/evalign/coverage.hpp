#pragma once

#include "types.hpp"

#include <cstddef>
#include <vector>

namespace evalign {

// Coverage of both sequences by matched records
struct CoverageStats {
    double generated_time_start = 0.0;
    double generated_time_end = 0.0;

    size_t generated_total = 0;
    size_t generated_matched = 0;      // distinct generated indices in matched records
    size_t generated_unmatched = 0;
    double generated_coverage_pct = 0.0;

    size_t reference_total = 0;        // reference events in the generated time range
    size_t reference_matched = 0;
    size_t reference_unmatched = 0;
    double reference_coverage_pct = 0.0;

    double precision = 0.0;            // generated_matched / generated_total
    double recall = 0.0;               // reference_matched / reference_total
    double f1 = 0.0;
};

// Record tallies by outcome
struct RecordCounts {
    size_t total = 0;
    size_t matched = 0;
    size_t unmatched_generated = 0;    // unmatched records carrying generated events
    size_t unmatched_reference = 0;    // unmatched records carrying reference events
};

// Ratio with a zero denominator guard
inline double safe_ratio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

inline double f1_score(double precision, double recall) {
    return (precision + recall) > 0.0 ? 2.0 * precision * recall / (precision + recall) : 0.0;
}

/**
 * Coverage / precision / recall of a matching.
 *
 * `reference` is expected to be pre-filtered to the generated time range.
 * Only records with matched == true contribute to the matched counts, and
 * each index counts once however many records list it.
 */
CoverageStats compute_coverage(const std::vector<Event>& generated,
                               const std::vector<Event>& reference,
                               const std::vector<Correspondence>& records);

RecordCounts count_records(const std::vector<Correspondence>& records);

}  // namespace evalign
