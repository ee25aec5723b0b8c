#pragma once
// Event matchers: align a generated event sequence with a reference sequence
//
// Three strategies share one contract, match(generated, reference):
//   cluster  N:M  connected components of the time-overlap graph
//   overlap  1:N  per generated event, every overlapping reference event
//   dp       1:1  global alignment on weighted time + text similarity
//
// Matchers are stateless between calls. All working state (union-find,
// score tables) lives inside match(), so one instance may be used from
// several threads at once.

#include "types.hpp"
#include "text_similarity.hpp"

#include <memory>
#include <string>
#include <vector>

namespace evalign {

enum class MatchMethod {
    CLUSTER,
    OVERLAP,
    DP
};

const char* match_method_to_string(MatchMethod method);

// Case-insensitive; throws std::invalid_argument for unknown names
MatchMethod parse_match_method(const std::string& name);

// Matcher configuration
struct MatcherParams {
    MatchMethod method = MatchMethod::CLUSTER;
    double min_overlap_sec = 0.5;       // cluster, overlap: min overlap to link two events

    // DP only
    double w_time = 0.3;                // weight of time similarity (not normalized)
    double w_text = 0.7;                // weight of text similarity
    double gap_penalty_generated = -0.2;  // cost of skipping a generated event
    double gap_penalty_reference = -0.2;  // cost of skipping a reference event
    double time_scale = 10.0;           // decay constant (seconds) of soft time similarity
    bool time_soft = true;              // exp(-|dstart|/scale) if true, temporal IoU otherwise
    TextSimilarity text_similarity;     // empty = token_jaccard
};

class Matcher {
public:
    virtual ~Matcher() = default;

    // Records in output order (see each matcher for ordering rules)
    virtual std::vector<Correspondence> match(const std::vector<Event>& generated,
                                              const std::vector<Event>& reference) const = 0;

    virtual const char* name() const = 0;
};

// ============================================================================
// Cluster matcher (N:M)
// ============================================================================

/**
 * Union-find over the combined event list, linking every pair that
 * overlaps by >= min_overlap_sec. O((n+m)^2) pair scan.
 *
 * Components with both origins become one `cluster` record; single-origin
 * components emit one `generated_only` / `reference_only` record per event.
 * Output is ordered by generated_start, falling back to reference_start.
 */
class ClusterMatcher : public Matcher {
public:
    explicit ClusterMatcher(double min_overlap_sec = 0.5)
        : min_overlap_sec_(min_overlap_sec) {}

    std::vector<Correspondence> match(const std::vector<Event>& generated,
                                      const std::vector<Event>& reference) const override;

    const char* name() const override { return "cluster"; }

    double min_overlap_sec() const { return min_overlap_sec_; }

private:
    double min_overlap_sec_;
};

// ============================================================================
// Overlap matcher (1:N)
// ============================================================================

/**
 * One record per generated event, in input order. Overlapping reference
 * events are listed by descending overlap (stable on ties). A reference
 * event may appear under several generated events; reference events that
 * overlap nothing are not reported.
 */
class OverlapMatcher : public Matcher {
public:
    explicit OverlapMatcher(double min_overlap_sec = 0.5)
        : min_overlap_sec_(min_overlap_sec) {}

    std::vector<Correspondence> match(const std::vector<Event>& generated,
                                      const std::vector<Event>& reference) const override;

    const char* name() const override { return "overlap"; }

    double min_overlap_sec() const { return min_overlap_sec_; }

private:
    double min_overlap_sec_;
};

// ============================================================================
// DP matcher (1:1 with gaps)
// ============================================================================

/**
 * Needleman-Wunsch style global alignment maximizing
 *   sum(w_time * time_sim + w_text * text_sim) + sum(gap penalties).
 *
 * Equal scores resolve diagonal > skip-generated > skip-reference.
 * Either sequence empty -> no records.
 */
class DPMatcher : public Matcher {
public:
    // Throws std::invalid_argument when time_soft is set and time_scale <= 0
    explicit DPMatcher(const MatcherParams& params = MatcherParams());

    std::vector<Correspondence> match(const std::vector<Event>& generated,
                                      const std::vector<Event>& reference) const override;

    const char* name() const override { return "dp"; }

    double time_similarity(const Event& g, const Event& r) const;
    double combined_similarity(const Event& g, const Event& r) const;

    // Row-major n x m matrix of combined_similarity
    std::vector<double> similarity_matrix(const std::vector<Event>& generated,
                                          const std::vector<Event>& reference) const;

private:
    double w_time_;
    double w_text_;
    double gap_generated_;
    double gap_reference_;
    double time_scale_;
    bool time_soft_;
    TextSimilarity text_similarity_;
};

// Build the matcher selected by params.method
std::unique_ptr<Matcher> make_matcher(const MatcherParams& params);

}  // namespace evalign
