#include "evalign/text_similarity.hpp"

#include <cctype>

namespace evalign {

std::unordered_set<std::string> token_set(const std::string& text) {
    std::unordered_set<std::string> tokens;
    std::string token;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            if (!token.empty()) {
                tokens.insert(token);
                token.clear();
            }
            continue;
        }
        // Bytes >= 0x80 (UTF-8 continuation) pass through unchanged
        token += (uc < 0x80) ? static_cast<char>(std::tolower(uc)) : c;
    }
    if (!token.empty()) tokens.insert(token);
    return tokens;
}

double token_jaccard(const std::string& a, const std::string& b) {
    const auto sa = token_set(a);
    const auto sb = token_set(b);
    if (sa.empty() || sb.empty()) return 0.0;

    size_t inter = 0;
    const auto& smaller = sa.size() <= sb.size() ? sa : sb;
    const auto& larger = sa.size() <= sb.size() ? sb : sa;
    for (const auto& t : smaller) {
        if (larger.count(t)) inter++;
    }
    const size_t uni = sa.size() + sb.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

TextSimilarity default_text_similarity() {
    return &token_jaccard;
}

}  // namespace evalign
