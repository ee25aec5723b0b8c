#include "evalign/types.hpp"

#include <algorithm>

namespace evalign {

const char* match_type_to_string(MatchType type) {
    switch (type) {
        case MatchType::CLUSTER: return "cluster";
        case MatchType::GENERATED_ONLY: return "generated_only";
        case MatchType::REFERENCE_ONLY: return "reference_only";
        case MatchType::OVERLAP: return "overlap";
        case MatchType::NO_OVERLAP: return "no_overlap";
        case MatchType::DP_MATCH: return "dp_match";
        case MatchType::DP_GEN_GAP: return "dp_gen_gap";
        case MatchType::DP_REF_GAP: return "dp_ref_gap";
    }
    return "unknown";
}

void sort_by_start(std::vector<Event>& events) {
    std::sort(events.begin(), events.end(),
              [](const Event& a, const Event& b) {
                  if (a.start != b.start) return a.start < b.start;
                  if (a.end != b.end) return a.end < b.end;
                  if (a.index != b.index) return a.index < b.index;
                  return a.text < b.text;
              });
}

std::string combine_texts(const std::vector<Event>& events, const std::string& separator) {
    if (events.empty()) return std::string();

    std::vector<Event> ordered = events;
    sort_by_start(ordered);

    std::string out = ordered.front().text;
    for (size_t i = 1; i < ordered.size(); ++i) {
        out += separator;
        out += ordered[i].text;
    }
    return out;
}

std::string format_indices(const std::vector<int>& indices, char delimiter) {
    std::string out;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) out += delimiter;
        out += std::to_string(indices[i]);
    }
    return out;
}

Correspondence make_correspondence(std::vector<Event> generated,
                                   std::vector<Event> reference,
                                   bool matched,
                                   MatchType type) {
    Correspondence rec;
    rec.matched = matched;
    rec.match_type = type;

    rec.combined_generated_text = combine_texts(generated);
    rec.combined_reference_text = combine_texts(reference);

    for (const auto& e : generated) {
        rec.generated_indices.push_back(e.index);
        rec.generated_start = rec.generated_start ? std::min(*rec.generated_start, e.start) : e.start;
        rec.generated_end = rec.generated_end ? std::max(*rec.generated_end, e.end) : e.end;
    }
    for (const auto& e : reference) {
        rec.reference_indices.push_back(e.index);
        rec.reference_start = rec.reference_start ? std::min(*rec.reference_start, e.start) : e.start;
        rec.reference_end = rec.reference_end ? std::max(*rec.reference_end, e.end) : e.end;
    }

    rec.generated_events = std::move(generated);
    rec.reference_events = std::move(reference);
    return rec;
}

}  // namespace evalign
