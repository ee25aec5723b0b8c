/**
 * DP matcher: global alignment of generated vs reference events
 *
 * Score table is (n+1) x (m+1), stored row-major with a back-pointer
 * table of the same shape. Row 0 / column 0 accumulate gap penalties.
 */

#include "evalign/matcher.hpp"
#include "evalign/interval.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace evalign {

namespace {

enum class Move : uint8_t {
    DIAGONAL,       // consume g[i-1] and r[j-1]
    SKIP_GENERATED, // consume g[i-1] only
    SKIP_REFERENCE  // consume r[j-1] only
};

struct Step {
    int gen;        // -1 = none
    int ref;        // -1 = none
    double score;
};

}  // namespace

DPMatcher::DPMatcher(const MatcherParams& params)
    : w_time_(params.w_time),
      w_text_(params.w_text),
      gap_generated_(params.gap_penalty_generated),
      gap_reference_(params.gap_penalty_reference),
      time_scale_(params.time_scale),
      time_soft_(params.time_soft),
      text_similarity_(params.text_similarity ? params.text_similarity
                                              : default_text_similarity()) {
    if (time_soft_ && !(time_scale_ > 0.0)) {
        throw std::invalid_argument("DP matcher: time_scale must be > 0 for soft time similarity");
    }
}

double DPMatcher::time_similarity(const Event& g, const Event& r) const {
    if (time_soft_) {
        return std::exp(-std::abs(g.start - r.start) / time_scale_);
    }
    return temporal_iou(g, r);
}

double DPMatcher::combined_similarity(const Event& g, const Event& r) const {
    const double s_text = text_similarity_(g.text, r.text);
    const double s_time = time_similarity(g, r);
    return w_time_ * s_time + w_text_ * s_text;
}

std::vector<double> DPMatcher::similarity_matrix(const std::vector<Event>& generated,
                                                 const std::vector<Event>& reference) const {
    const size_t n = generated.size();
    const size_t m = reference.size();
    std::vector<double> sim(n * m);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            sim[i * m + j] = combined_similarity(generated[i], reference[j]);
        }
    }
    return sim;
}

std::vector<Correspondence> DPMatcher::match(const std::vector<Event>& generated,
                                             const std::vector<Event>& reference) const {
    if (generated.empty() || reference.empty()) return {};

    const size_t n = generated.size();
    const size_t m = reference.size();
    const size_t stride = m + 1;
    const std::vector<double> sim = similarity_matrix(generated, reference);

    std::vector<double> dp((n + 1) * stride, 0.0);
    std::vector<Move> back((n + 1) * stride, Move::DIAGONAL);

    for (size_t i = 1; i <= n; ++i) {
        dp[i * stride] = dp[(i - 1) * stride] + gap_generated_;
        back[i * stride] = Move::SKIP_GENERATED;
    }
    for (size_t j = 1; j <= m; ++j) {
        dp[j] = dp[j - 1] + gap_reference_;
        back[j] = Move::SKIP_REFERENCE;
    }

    for (size_t i = 1; i <= n; ++i) {
        for (size_t j = 1; j <= m; ++j) {
            const double diag = dp[(i - 1) * stride + (j - 1)] + sim[(i - 1) * m + (j - 1)];
            const double skip_gen = dp[(i - 1) * stride + j] + gap_generated_;
            const double skip_ref = dp[i * stride + (j - 1)] + gap_reference_;

            // Strict comparisons: ties keep the earlier candidate
            double best = diag;
            Move move = Move::DIAGONAL;
            if (skip_gen > best) {
                best = skip_gen;
                move = Move::SKIP_GENERATED;
            }
            if (skip_ref > best) {
                best = skip_ref;
                move = Move::SKIP_REFERENCE;
            }
            dp[i * stride + j] = best;
            back[i * stride + j] = move;
        }
    }

    // Backtrace from (n, m)
    std::vector<Step> path;
    path.reserve(n + m);
    size_t i = n, j = m;
    while (i > 0 || j > 0) {
        const Move move = back[i * stride + j];
        if (i > 0 && j > 0 && move == Move::DIAGONAL) {
            path.push_back({static_cast<int>(i - 1), static_cast<int>(j - 1),
                            sim[(i - 1) * m + (j - 1)]});
            --i;
            --j;
        } else if (i > 0 && (j == 0 || move == Move::SKIP_GENERATED)) {
            path.push_back({static_cast<int>(i - 1), -1, gap_generated_});
            --i;
        } else {
            path.push_back({-1, static_cast<int>(j - 1), gap_reference_});
            --j;
        }
    }
    std::reverse(path.begin(), path.end());

    std::vector<Correspondence> records;
    records.reserve(path.size());
    for (const auto& step : path) {
        Correspondence rec;
        if (step.gen >= 0 && step.ref >= 0) {
            rec = make_correspondence({generated[step.gen]}, {reference[step.ref]}, true,
                                      MatchType::DP_MATCH);
        } else if (step.gen >= 0) {
            rec = make_correspondence({generated[step.gen]}, {}, false, MatchType::DP_GEN_GAP);
        } else {
            rec = make_correspondence({}, {reference[step.ref]}, false, MatchType::DP_REF_GAP);
        }
        rec.score = step.score;
        records.push_back(std::move(rec));
    }

    return records;
}

}  // namespace evalign
