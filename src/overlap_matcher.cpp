#include "evalign/matcher.hpp"
#include "evalign/interval.hpp"

#include <algorithm>
#include <utility>

namespace evalign {

std::vector<Correspondence> OverlapMatcher::match(const std::vector<Event>& generated,
                                                  const std::vector<Event>& reference) const {
    std::vector<Correspondence> records;
    records.reserve(generated.size());

    std::vector<std::pair<const Event*, double>> hits;
    for (const auto& g : generated) {
        hits.clear();
        for (const auto& r : reference) {
            double overlap = overlap_duration(g, r);
            if (overlap >= min_overlap_sec_) {
                hits.emplace_back(&r, overlap);
            }
        }

        if (hits.empty()) {
            records.push_back(make_correspondence({g}, {}, false, MatchType::NO_OVERLAP));
            continue;
        }

        // Largest overlap first, scan order on ties
        std::stable_sort(hits.begin(), hits.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });

        std::vector<Event> ref_events;
        ref_events.reserve(hits.size());
        for (const auto& h : hits) ref_events.push_back(*h.first);

        records.push_back(make_correspondence({g}, std::move(ref_events), true,
                                              MatchType::OVERLAP));
    }

    return records;
}

}  // namespace evalign
