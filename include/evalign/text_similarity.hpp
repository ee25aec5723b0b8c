#pragma once

#include <functional>
#include <string>
#include <unordered_set>

namespace evalign {

// Pluggable text similarity used by the DP matcher, expected in [0, 1]
using TextSimilarity = std::function<double(const std::string&, const std::string&)>;

// Lower-cased (ASCII) whitespace tokens as a set
std::unordered_set<std::string> token_set(const std::string& text);

// |A & B| / |A | B| over token sets; 0 when either side has no tokens
double token_jaccard(const std::string& a, const std::string& b);

// Default strategy for MatcherParams::text_similarity
TextSimilarity default_text_similarity();

}  // namespace evalign
