#pragma once

#include "coverage.hpp"
#include "event_io.hpp"
#include "matcher.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace evalign {

struct EvaluationOptions {
    MatcherParams matcher;
    bool filter_speech_type = true;   // reference: keep speech_type == "ad" rows only
    bool range_filter = true;         // reference: keep events overlapping the generated range
};

// Result of evaluating one generated / reference pair
struct Evaluation {
    std::string generated_path;
    std::string reference_path;
    std::string matcher;              // matcher name

    std::vector<Event> generated;
    std::vector<Event> reference;     // after filtering
    std::vector<Correspondence> records;

    CoverageStats coverage;
    RecordCounts counts;
};

/**
 * Load both tables, restrict the reference to the generated time range,
 * match and score.
 *
 * The generated table is read without any speech_type filter. Throws
 * EventTableError on unreadable input, std::invalid_argument on a bad
 * matcher configuration.
 */
Evaluation evaluate_files(const std::string& generated_path,
                          const std::string& reference_path,
                          const EvaluationOptions& options = EvaluationOptions());

// Same as evaluate_files for sequences already in memory. The reference is
// range-filtered here when options.range_filter is set.
Evaluation evaluate_events(std::vector<Event> generated,
                           std::vector<Event> reference,
                           const EvaluationOptions& options = EvaluationOptions());

}  // namespace evalign
