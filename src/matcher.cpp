#include "evalign/matcher.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace evalign {

const char* match_method_to_string(MatchMethod method) {
    switch (method) {
        case MatchMethod::CLUSTER: return "cluster";
        case MatchMethod::OVERLAP: return "overlap";
        case MatchMethod::DP: return "dp";
    }
    return "unknown";
}

MatchMethod parse_match_method(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cluster") return MatchMethod::CLUSTER;
    if (lower == "overlap") return MatchMethod::OVERLAP;
    if (lower == "dp") return MatchMethod::DP;

    throw std::invalid_argument("Unknown matcher: " + name +
                                " (available: cluster, dp, overlap)");
}

std::unique_ptr<Matcher> make_matcher(const MatcherParams& params) {
    switch (params.method) {
        case MatchMethod::CLUSTER:
            return std::make_unique<ClusterMatcher>(params.min_overlap_sec);
        case MatchMethod::OVERLAP:
            return std::make_unique<OverlapMatcher>(params.min_overlap_sec);
        case MatchMethod::DP:
            return std::make_unique<DPMatcher>(params);
    }
    throw std::invalid_argument("Unknown matcher method");
}

}  // namespace evalign
