#pragma once

#include <optional>
#include <string>
#include <vector>

namespace evalign {

// A time-bounded, text-bearing unit from either sequence.
// `index` is the 0-based position in its origin sequence, set once by the loader.
struct Event {
    double start = 0.0;   // seconds
    double end = 0.0;     // seconds, start <= end
    std::string text;
    int index = -1;
};

// How a correspondence record came to be
enum class MatchType {
    CLUSTER,          // connected component with both origins
    GENERATED_ONLY,   // cluster component with generated events only
    REFERENCE_ONLY,   // cluster component with reference events only
    OVERLAP,          // generated event with >= 1 overlapping reference event
    NO_OVERLAP,       // generated event without any overlapping reference event
    DP_MATCH,         // diagonal step of the global alignment
    DP_GEN_GAP,       // generated event skipped by the alignment
    DP_REF_GAP        // reference event skipped by the alignment
};

const char* match_type_to_string(MatchType type);

/**
 * Correspondence between zero or more generated events and zero or more
 * reference events.
 *
 * Invariants:
 *   - matched implies both event lists are non-empty
 *   - generated_start/end are empty iff generated_events is empty
 *     (same for the reference side)
 *   - combined texts are joined in start order (see combine_texts)
 */
struct Correspondence {
    std::vector<Event> generated_events;
    std::vector<Event> reference_events;
    std::vector<int> generated_indices;
    std::vector<int> reference_indices;
    std::string combined_generated_text;
    std::string combined_reference_text;
    std::optional<double> generated_start;
    std::optional<double> generated_end;
    std::optional<double> reference_start;
    std::optional<double> reference_end;
    bool matched = false;
    MatchType match_type = MatchType::CLUSTER;
    std::optional<double> score;

    size_t num_generated() const { return generated_events.size(); }
    size_t num_reference() const { return reference_events.size(); }
};

// Build a record from two event groups. Indices follow the given event
// order, bounds are min(start)/max(end) per side, texts go through
// combine_texts. Score is left empty.
Correspondence make_correspondence(std::vector<Event> generated,
                                   std::vector<Event> reference,
                                   bool matched,
                                   MatchType type);

// Order events by start; ties fall back to end, index, then text so the
// result does not depend on input order.
void sort_by_start(std::vector<Event>& events);

// Space-join event texts in start order
std::string combine_texts(const std::vector<Event>& events,
                          const std::string& separator = " ");

// "3,4,7" (empty string for no indices)
std::string format_indices(const std::vector<int>& indices, char delimiter = ',');

}  // namespace evalign
