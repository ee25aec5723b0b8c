/**
 * Cluster matcher: connected components of the time-overlap graph
 */

#include "evalign/matcher.hpp"
#include "evalign/disjoint_set.hpp"
#include "evalign/interval.hpp"

#include <algorithm>
#include <unordered_map>

namespace evalign {

namespace {

struct Member {
    const Event* event;
    bool generated;
};

// (time, tier): generated time first, then reference time, then neither
std::pair<double, int> record_sort_key(const Correspondence& rec) {
    if (rec.generated_start) return {*rec.generated_start, 0};
    if (rec.reference_start) return {*rec.reference_start, 1};
    return {0.0, 2};
}

}  // namespace

std::vector<Correspondence> ClusterMatcher::match(const std::vector<Event>& generated,
                                                  const std::vector<Event>& reference) const {
    std::vector<Member> members;
    members.reserve(generated.size() + reference.size());
    for (const auto& e : generated) members.push_back({&e, true});
    for (const auto& e : reference) members.push_back({&e, false});

    const int n = static_cast<int>(members.size());
    if (n == 0) return {};

    DisjointSet dsu(members.size());
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            if (overlaps_with(*members[i].event, *members[j].event, min_overlap_sec_)) {
                dsu.unite(i, j);
            }
        }
    }

    // Components in order of first appearance
    std::unordered_map<int, size_t> slot_of_root;
    std::vector<std::vector<int>> components;
    for (int i = 0; i < n; ++i) {
        int root = dsu.find(i);
        auto it = slot_of_root.find(root);
        if (it == slot_of_root.end()) {
            slot_of_root.emplace(root, components.size());
            components.push_back({i});
        } else {
            components[it->second].push_back(i);
        }
    }

    std::vector<Correspondence> records;
    records.reserve(components.size());

    for (const auto& comp : components) {
        std::vector<Event> gen_events;
        std::vector<Event> ref_events;
        for (int idx : comp) {
            if (members[idx].generated) {
                gen_events.push_back(*members[idx].event);
            } else {
                ref_events.push_back(*members[idx].event);
            }
        }

        if (!gen_events.empty() && !ref_events.empty()) {
            sort_by_start(gen_events);
            sort_by_start(ref_events);
            records.push_back(make_correspondence(std::move(gen_events), std::move(ref_events),
                                                  true, MatchType::CLUSTER));
        } else if (!gen_events.empty()) {
            for (auto& e : gen_events) {
                records.push_back(make_correspondence({std::move(e)}, {}, false,
                                                      MatchType::GENERATED_ONLY));
            }
        } else {
            for (auto& e : ref_events) {
                records.push_back(make_correspondence({}, {std::move(e)}, false,
                                                      MatchType::REFERENCE_ONLY));
            }
        }
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const Correspondence& a, const Correspondence& b) {
                         return record_sort_key(a) < record_sort_key(b);
                     });

    return records;
}

}  // namespace evalign
