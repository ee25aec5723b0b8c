#include "evalign/coverage.hpp"
#include "evalign/interval.hpp"

#include <unordered_set>

namespace evalign {

CoverageStats compute_coverage(const std::vector<Event>& generated,
                               const std::vector<Event>& reference,
                               const std::vector<Correspondence>& records) {
    CoverageStats s;

    const auto range = time_range(generated);
    s.generated_time_start = range.first;
    s.generated_time_end = range.second;

    std::unordered_set<int> gen_seen;
    std::unordered_set<int> ref_seen;
    for (const auto& rec : records) {
        if (!rec.matched) continue;
        gen_seen.insert(rec.generated_indices.begin(), rec.generated_indices.end());
        ref_seen.insert(rec.reference_indices.begin(), rec.reference_indices.end());
    }

    s.generated_total = generated.size();
    s.generated_matched = gen_seen.size();
    s.generated_unmatched = s.generated_total > s.generated_matched
                                ? s.generated_total - s.generated_matched : 0;
    s.generated_coverage_pct = safe_ratio(static_cast<double>(s.generated_matched),
                                          static_cast<double>(s.generated_total)) * 100.0;

    s.reference_total = reference.size();
    s.reference_matched = ref_seen.size();
    s.reference_unmatched = s.reference_total > s.reference_matched
                                ? s.reference_total - s.reference_matched : 0;
    s.reference_coverage_pct = safe_ratio(static_cast<double>(s.reference_matched),
                                          static_cast<double>(s.reference_total)) * 100.0;

    s.precision = safe_ratio(static_cast<double>(s.generated_matched),
                             static_cast<double>(s.generated_total));
    s.recall = safe_ratio(static_cast<double>(s.reference_matched),
                          static_cast<double>(s.reference_total));
    s.f1 = f1_score(s.precision, s.recall);

    return s;
}

RecordCounts count_records(const std::vector<Correspondence>& records) {
    RecordCounts c;
    c.total = records.size();
    for (const auto& rec : records) {
        if (rec.matched) {
            c.matched++;
            continue;
        }
        if (!rec.generated_events.empty()) c.unmatched_generated++;
        if (!rec.reference_events.empty()) c.unmatched_reference++;
    }
    return c;
}

}  // namespace evalign
