// tests/test_matchers.cpp
//
// Behaviour of the three matchers:
//   cluster  transitive N:M grouping, unmatched singles, ordering
//   overlap  1:N per generated event, reference events may repeat or vanish
//   dp       1:1 alignment with gaps, tie-breaking, similarity options
// plus index coverage, degenerate inputs and the matcher factory.

#include "evalign/matcher.hpp"

#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using evalign::Correspondence;
using evalign::Event;
using evalign::MatchType;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        failed++;
    }
}

bool near(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

Event ev(double start, double end, const std::string& text, int index) {
    Event e;
    e.start = start;
    e.end = end;
    e.text = text;
    e.index = index;
    return e;
}

// index -> number of records listing it
std::map<int, int> index_counts(const std::vector<Correspondence>& records, bool generated) {
    std::map<int, int> counts;
    for (const auto& rec : records) {
        const auto& idx = generated ? rec.generated_indices : rec.reference_indices;
        for (int i : idx) counts[i]++;
    }
    return counts;
}

bool each_index_once(const std::vector<Correspondence>& records, bool generated, int n) {
    auto counts = index_counts(records, generated);
    if (static_cast<int>(counts.size()) != n) return false;
    for (int i = 0; i < n; ++i) {
        auto it = counts.find(i);
        if (it == counts.end() || it->second != 1) return false;
    }
    return true;
}

std::vector<Event> scenario_a_generated() {
    return {ev(0, 5, "cat", 0), ev(10, 15, "dog", 1)};
}

std::vector<Event> scenario_a_reference() {
    return {ev(1, 4, "cat sits", 0)};
}

evalign::MatcherParams text_only_params() {
    evalign::MatcherParams p;
    p.method = evalign::MatchMethod::DP;
    p.w_time = 0.0;
    p.w_text = 1.0;
    return p;
}

// ---------------------------------------------------------------------------
// Cluster
// ---------------------------------------------------------------------------

int test_cluster_scenario_a() {
    std::cout << "[cluster] one matched cluster plus one generated_only\n";
    int failed = 0;

    evalign::ClusterMatcher matcher(0.5);
    auto records = matcher.match(scenario_a_generated(), scenario_a_reference());

    expect(records.size() == 2, "two records", failed);
    if (records.size() != 2) return failed;

    const auto& c = records[0];
    expect(c.matched && c.match_type == MatchType::CLUSTER, "first record is a matched cluster", failed);
    expect(c.generated_indices == std::vector<int>({0}), "cluster generated index", failed);
    expect(c.reference_indices == std::vector<int>({0}), "cluster reference index", failed);
    expect(near(*c.generated_start, 0.0) && near(*c.generated_end, 5.0), "generated span 0-5", failed);
    expect(near(*c.reference_start, 1.0) && near(*c.reference_end, 4.0), "reference span 1-4", failed);
    expect(!c.score, "cluster records carry no score", failed);

    const auto& g = records[1];
    expect(!g.matched && g.match_type == MatchType::GENERATED_ONLY, "second record is generated_only", failed);
    expect(g.generated_indices == std::vector<int>({1}) && g.reference_indices.empty(),
           "generated_only carries the dog event only", failed);
    expect(g.combined_generated_text == "dog", "generated_only text", failed);

    return failed;
}

int test_cluster_transitivity() {
    std::cout << "[cluster] A~B and B~C puts A, B, C in one record\n";
    int failed = 0;

    // A(0,5) and C(8,12) do not overlap; both overlap B(4,9) by 1s
    std::vector<Event> gen = {ev(8, 12, "C", 1), ev(0, 5, "A", 0)};
    std::vector<Event> ref = {ev(4, 9, "B", 0)};

    evalign::ClusterMatcher matcher(0.5);
    auto records = matcher.match(gen, ref);

    expect(records.size() == 1, "single record", failed);
    if (records.empty()) return failed;
    expect(records[0].matched, "record is matched", failed);
    expect(records[0].generated_indices == std::vector<int>({0, 1}),
           "generated events sorted by start within the cluster", failed);
    expect(records[0].combined_generated_text == "A C", "combined text in start order", failed);
    expect(near(*records[0].generated_start, 0.0) && near(*records[0].generated_end, 12.0),
           "cluster span covers all generated events", failed);

    return failed;
}

int test_cluster_ordering_and_coverage() {
    std::cout << "[cluster] ordering and index coverage\n";
    int failed = 0;

    std::vector<Event> gen = {ev(0, 3, "g0", 0), ev(20, 25, "g1", 1), ev(40, 44, "g2", 2),
                              ev(41, 50, "g3", 3)};
    std::vector<Event> ref = {ev(1, 2.5, "r0", 0), ev(10, 12, "r1", 1), ev(42, 48, "r2", 2),
                              ev(60, 61, "r3", 3)};

    evalign::ClusterMatcher matcher(0.5);
    auto records = matcher.match(gen, ref);

    expect(each_index_once(records, true, 4), "every generated index exactly once", failed);
    expect(each_index_once(records, false, 4), "every reference index exactly once", failed);

    // Expected order: cluster@0, ref_only@10, gen_only@20, cluster@40, ref_only@60
    std::vector<MatchType> types;
    for (const auto& r : records) types.push_back(r.match_type);
    std::vector<MatchType> expected = {MatchType::CLUSTER, MatchType::REFERENCE_ONLY,
                                       MatchType::GENERATED_ONLY, MatchType::CLUSTER,
                                       MatchType::REFERENCE_ONLY};
    expect(types == expected, "records ordered by generated start, else reference start", failed);
    if (records.size() == 5) {
        expect(records[3].generated_indices == std::vector<int>({2, 3}), "g2 and g3 share a cluster", failed);
    }

    return failed;
}

int test_cluster_determinism() {
    std::cout << "[cluster] combined text does not depend on input order\n";
    int failed = 0;

    std::vector<Event> gen_a = {ev(0, 4, "first", 0), ev(3, 8, "second", 1), ev(7, 12, "third", 2)};
    std::vector<Event> gen_b = {gen_a[2], gen_a[0], gen_a[1]};
    std::vector<Event> ref = {ev(2, 10, "ref", 0)};

    evalign::ClusterMatcher matcher(0.5);
    auto ra = matcher.match(gen_a, ref);
    auto rb = matcher.match(gen_b, ref);

    expect(ra.size() == 1 && rb.size() == 1, "one cluster each", failed);
    if (ra.size() == 1 && rb.size() == 1) {
        expect(ra[0].combined_generated_text == "first second third", "sorted text", failed);
        expect(ra[0].combined_generated_text == rb[0].combined_generated_text, "same text", failed);
        expect(ra[0].generated_indices == rb[0].generated_indices, "same index order", failed);
    }

    return failed;
}

int test_cluster_boundaries() {
    std::cout << "[cluster] min_overlap_sec boundaries\n";
    int failed = 0;

    {
        evalign::ClusterMatcher matcher(0.0);
        auto records = matcher.match({ev(0, 5, "g", 0)}, {ev(5, 8, "r", 0)});
        expect(records.size() == 1 && records[0].matched,
               "touching intervals link at threshold 0", failed);
    }
    {
        evalign::ClusterMatcher matcher(0.5);
        auto records = matcher.match({ev(0, 5, "g", 0)}, {ev(5, 8, "r", 0)});
        expect(records.size() == 2, "touching intervals stay apart at threshold 0.5", failed);
    }
    {
        evalign::ClusterMatcher matcher(1000.0);
        auto records = matcher.match(scenario_a_generated(), scenario_a_reference());
        expect(records.size() == 3, "huge threshold: one record per event", failed);
        bool none_matched = true;
        for (const auto& r : records) none_matched = none_matched && !r.matched;
        expect(none_matched, "huge threshold: nothing matched", failed);
    }

    return failed;
}

int test_cluster_degenerate() {
    std::cout << "[cluster] empty inputs\n";
    int failed = 0;

    evalign::ClusterMatcher matcher;
    expect(matcher.match({}, {}).empty(), "both empty -> no records", failed);

    auto gen_only = matcher.match(scenario_a_generated(), {});
    expect(gen_only.size() == 2, "empty reference -> one record per generated event", failed);
    for (const auto& r : gen_only) {
        expect(r.match_type == MatchType::GENERATED_ONLY, "generated_only", failed);
    }

    auto ref_only = matcher.match({}, scenario_a_reference());
    expect(ref_only.size() == 1 && ref_only[0].match_type == MatchType::REFERENCE_ONLY,
           "empty generated -> reference_only", failed);

    return failed;
}

// ---------------------------------------------------------------------------
// Overlap
// ---------------------------------------------------------------------------

int test_overlap_scenario_a() {
    std::cout << "[overlap] one overlap record plus one no_overlap\n";
    int failed = 0;

    evalign::OverlapMatcher matcher(0.5);
    auto records = matcher.match(scenario_a_generated(), scenario_a_reference());

    expect(records.size() == 2, "one record per generated event", failed);
    if (records.size() != 2) return failed;
    expect(records[0].matched && records[0].match_type == MatchType::OVERLAP, "cat overlaps", failed);
    expect(records[0].reference_indices == std::vector<int>({0}), "cat claims the reference", failed);
    expect(near(*records[0].reference_start, 1.0) && near(*records[0].reference_end, 4.0),
           "reference span", failed);
    expect(!records[1].matched && records[1].match_type == MatchType::NO_OVERLAP, "dog has none", failed);
    expect(!records[1].reference_start, "no reference span on no_overlap", failed);

    return failed;
}

int test_overlap_ordering_and_asymmetry() {
    std::cout << "[overlap] descending overlap, shared and vanishing references\n";
    int failed = 0;

    std::vector<Event> gen = {ev(0, 10, "wide", 0), ev(8, 12, "late", 1)};
    std::vector<Event> ref = {ev(0, 2, "short", 0), ev(3, 9, "long", 1), ev(9, 11, "tail", 2),
                              ev(50, 55, "orphan", 3)};

    evalign::OverlapMatcher matcher(0.5);
    auto records = matcher.match(gen, ref);

    expect(records.size() == 2, "one record per generated event", failed);
    if (records.size() != 2) return failed;

    // overlaps with "wide": long 6, short 2, tail 1
    expect(records[0].reference_indices == std::vector<int>({1, 0, 2}),
           "reference events by descending overlap", failed);
    expect(records[0].combined_reference_text == "short long tail",
           "combined text still in start order", failed);

    // "late" overlaps long by 1 and tail by 2
    expect(records[1].reference_indices == std::vector<int>({2, 1}), "second record", failed);

    auto ref_counts = index_counts(records, false);
    expect(ref_counts[1] == 2 && ref_counts[2] == 2, "reference events may be claimed twice", failed);
    expect(ref_counts.find(3) == ref_counts.end(), "unclaimed reference events are not reported", failed);
    expect(each_index_once(records, true, 2), "each generated index exactly once", failed);

    return failed;
}

int test_overlap_degenerate() {
    std::cout << "[overlap] empty inputs\n";
    int failed = 0;

    evalign::OverlapMatcher matcher;
    expect(matcher.match({}, scenario_a_reference()).empty(), "empty generated -> no records", failed);

    auto records = matcher.match(scenario_a_generated(), {});
    expect(records.size() == 2, "empty reference -> one record per generated event", failed);
    for (const auto& r : records) {
        expect(r.match_type == MatchType::NO_OVERLAP && !r.matched, "no_overlap", failed);
    }

    return failed;
}

// ---------------------------------------------------------------------------
// DP
// ---------------------------------------------------------------------------

int test_dp_scenario_b() {
    std::cout << "[dp] identical single events align with score 1\n";
    int failed = 0;

    auto params = text_only_params();
    params.gap_penalty_generated = -0.7;
    params.gap_penalty_reference = -0.1;
    evalign::DPMatcher matcher(params);
    auto records = matcher.match({ev(0, 1, "a b", 0)}, {ev(0, 1, "a b", 0)});

    expect(records.size() == 1, "single record", failed);
    if (records.empty()) return failed;
    expect(records[0].matched && records[0].match_type == MatchType::DP_MATCH, "dp_match", failed);
    expect(records[0].score && near(*records[0].score, 1.0), "score 1.0", failed);

    return failed;
}

int test_dp_gaps() {
    std::cout << "[dp] skipped generated event becomes a gap record\n";
    int failed = 0;

    evalign::DPMatcher matcher(text_only_params());
    std::vector<Event> gen = {ev(0, 1, "a", 0), ev(2, 3, "b", 1), ev(4, 5, "c", 2)};
    std::vector<Event> ref = {ev(0, 1, "a", 0), ev(4, 5, "c", 1)};
    auto records = matcher.match(gen, ref);

    expect(records.size() == 3, "three records", failed);
    if (records.size() != 3) return failed;

    expect(records[0].match_type == MatchType::DP_MATCH &&
               records[0].generated_indices == std::vector<int>({0}) &&
               records[0].reference_indices == std::vector<int>({0}),
           "a-a aligned", failed);
    expect(records[1].match_type == MatchType::DP_GEN_GAP && !records[1].matched &&
               records[1].generated_indices == std::vector<int>({1}) &&
               records[1].reference_indices.empty(),
           "b skipped", failed);
    expect(records[1].score && near(*records[1].score, -0.2), "gap record carries the gap penalty", failed);
    expect(records[2].match_type == MatchType::DP_MATCH &&
               records[2].generated_indices == std::vector<int>({2}) &&
               records[2].reference_indices == std::vector<int>({1}),
           "c-c aligned", failed);

    expect(each_index_once(records, true, 3), "each generated index exactly once", failed);
    expect(each_index_once(records, false, 2), "each reference index exactly once", failed);

    return failed;
}

int test_dp_reference_gap_and_coverage() {
    std::cout << "[dp] reference gaps and index coverage\n";
    int failed = 0;

    evalign::DPMatcher matcher(text_only_params());
    std::vector<Event> gen = {ev(0, 1, "door opens", 0), ev(9, 10, "car leaves", 1)};
    std::vector<Event> ref = {ev(0, 1, "the door opens", 0), ev(4, 5, "rain falls", 1),
                              ev(9, 10, "a car leaves", 2)};
    auto records = matcher.match(gen, ref);

    expect(each_index_once(records, true, 2), "each generated index exactly once", failed);
    expect(each_index_once(records, false, 3), "each reference index exactly once", failed);

    bool saw_ref_gap = false;
    for (const auto& r : records) {
        if (r.match_type == MatchType::DP_REF_GAP) {
            saw_ref_gap = true;
            expect(r.reference_indices == std::vector<int>({1}), "rain falls is the skipped reference", failed);
            expect(r.score && near(*r.score, -0.2), "reference gap penalty", failed);
        }
    }
    expect(saw_ref_gap, "one reference gap", failed);

    return failed;
}

int test_dp_tie_break() {
    std::cout << "[dp] exact ties: diagonal, then skip-generated, then skip-reference\n";
    int failed = 0;

    // sim = 0 and zero gap penalties: diagonal, skip-gen and skip-ref all score 0
    auto params = text_only_params();
    params.gap_penalty_generated = 0.0;
    params.gap_penalty_reference = 0.0;
    evalign::DPMatcher matcher(params);
    auto records = matcher.match({ev(0, 1, "cat", 0)}, {ev(0, 1, "dog", 0)});

    expect(records.size() == 1, "single diagonal step", failed);
    if (!records.empty()) {
        expect(records[0].match_type == MatchType::DP_MATCH, "dp_match on tie", failed);
        expect(records[0].score && near(*records[0].score, 0.0), "score 0", failed);
    }

    // sim = -1: skip-gen and skip-ref tie at 0 above the diagonal. Skip-gen wins
    // at (1, 1), so the path is ref gap then gen gap.
    auto negative = params;
    negative.text_similarity = [](const std::string&, const std::string&) { return -1.0; };
    evalign::DPMatcher gap_matcher(negative);
    auto gaps = gap_matcher.match({ev(0, 1, "cat", 0)}, {ev(0, 1, "dog", 0)});

    expect(gaps.size() == 2, "two gap steps", failed);
    if (gaps.size() == 2) {
        expect(gaps[0].match_type == MatchType::DP_REF_GAP && gaps[0].reference_indices == std::vector<int>{0},
               "reference gap first", failed);
        expect(gaps[1].match_type == MatchType::DP_GEN_GAP && gaps[1].generated_indices == std::vector<int>{0},
               "skip-generated preferred over skip-reference on a tie", failed);
    }

    return failed;
}

int test_dp_similarity_options() {
    std::cout << "[dp] soft / hard time and injected text similarity\n";
    int failed = 0;

    evalign::MatcherParams soft;
    soft.method = evalign::MatchMethod::DP;
    soft.w_time = 1.0;
    soft.w_text = 0.0;
    evalign::DPMatcher soft_matcher(soft);
    expect(near(soft_matcher.time_similarity(ev(0, 1, "", 0), ev(10, 11, "", 0)), std::exp(-1.0)),
           "soft time similarity exp(-|ds|/scale)", failed);

    evalign::MatcherParams hard = soft;
    hard.time_soft = false;
    evalign::DPMatcher hard_matcher(hard);
    expect(near(hard_matcher.time_similarity(ev(0, 4, "", 0), ev(2, 6, "", 0)), 2.0 / 6.0),
           "hard time similarity is temporal IoU", failed);

    evalign::MatcherParams custom = text_only_params();
    custom.text_similarity = [](const std::string&, const std::string&) { return 0.25; };
    evalign::DPMatcher custom_matcher(custom);
    expect(near(custom_matcher.combined_similarity(ev(0, 1, "x", 0), ev(0, 1, "y", 0)), 0.25),
           "injected text similarity is used", failed);

    auto sim = custom_matcher.similarity_matrix({ev(0, 1, "a", 0), ev(1, 2, "b", 1)},
                                                {ev(0, 1, "c", 0), ev(1, 2, "d", 1), ev(2, 3, "e", 2)});
    expect(sim.size() == 6, "similarity matrix is n x m", failed);

    evalign::MatcherParams weighted;
    weighted.method = evalign::MatchMethod::DP;
    evalign::DPMatcher default_matcher(weighted);
    expect(near(default_matcher.combined_similarity(ev(0, 1, "a b", 0), ev(0, 1, "a b", 0)), 1.0),
           "default weights 0.3 + 0.7 on a perfect pair", failed);

    return failed;
}

int test_dp_degenerate_and_errors() {
    std::cout << "[dp] empty inputs and configuration errors\n";
    int failed = 0;

    evalign::DPMatcher matcher;
    expect(matcher.match({}, scenario_a_reference()).empty(), "empty generated -> no records", failed);
    expect(matcher.match(scenario_a_generated(), {}).empty(), "empty reference -> no records", failed);

    evalign::MatcherParams bad;
    bad.time_scale = 0.0;
    bool threw = false;
    try {
        evalign::DPMatcher m(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "time_scale 0 with soft time throws", failed);

    bad.time_soft = false;
    threw = false;
    try {
        evalign::DPMatcher m(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(!threw, "time_scale is ignored with hard time", failed);

    return failed;
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

int test_factory() {
    std::cout << "[matcher] parse_match_method / make_matcher\n";
    int failed = 0;
    using evalign::MatchMethod;

    expect(evalign::parse_match_method("cluster") == MatchMethod::CLUSTER, "cluster", failed);
    expect(evalign::parse_match_method("Overlap") == MatchMethod::OVERLAP, "overlap, any case", failed);
    expect(evalign::parse_match_method("DP") == MatchMethod::DP, "dp, any case", failed);

    bool threw = false;
    try {
        (void)evalign::parse_match_method("hungarian");
    } catch (const std::invalid_argument& e) {
        threw = std::string(e.what()).find("hungarian") != std::string::npos;
    }
    expect(threw, "unknown matcher name throws and names the input", failed);

    evalign::MatcherParams p;
    for (MatchMethod m : {MatchMethod::CLUSTER, MatchMethod::OVERLAP, MatchMethod::DP}) {
        p.method = m;
        auto matcher = evalign::make_matcher(p);
        expect(matcher && std::string(matcher->name()) == evalign::match_method_to_string(m),
               std::string("factory builds ") + evalign::match_method_to_string(m), failed);
    }

    p.method = MatchMethod::OVERLAP;
    p.min_overlap_sec = 1.25;
    auto overlap = evalign::make_matcher(p);
    auto* typed = dynamic_cast<evalign::OverlapMatcher*>(overlap.get());
    expect(typed && near(typed->min_overlap_sec(), 1.25), "factory forwards min_overlap_sec", failed);

    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_cluster_scenario_a();
    total += test_cluster_transitivity();
    total += test_cluster_ordering_and_coverage();
    total += test_cluster_determinism();
    total += test_cluster_boundaries();
    total += test_cluster_degenerate();
    total += test_overlap_scenario_a();
    total += test_overlap_ordering_and_asymmetry();
    total += test_overlap_degenerate();
    total += test_dp_scenario_b();
    total += test_dp_gaps();
    total += test_dp_reference_gap_and_coverage();
    total += test_dp_tie_break();
    total += test_dp_similarity_options();
    total += test_dp_degenerate_and_errors();
    total += test_factory();

    if (total == 0) {
        std::cout << "\nAll matcher tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
