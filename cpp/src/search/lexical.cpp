#include "dreamgroup/search/lexical.hpp"
#include "dreamgroup/util/text.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace dreamgroup::search {

namespace {

struct Block {
    size_t a = 0;
    size_t b = 0;
    size_t size = 0;
};

// Longest common substring of a[alo, ahi) and b[blo, bhi); earliest in a, then in b, on ties
Block longest_match(std::string_view a, size_t alo, size_t ahi,
                    std::string_view b, size_t blo, size_t bhi) {
    Block best{alo, blo, 0};
    std::vector<size_t> prev(bhi - blo + 1, 0);
    std::vector<size_t> curr(bhi - blo + 1, 0);
    for (size_t i = alo; i < ahi; ++i) {
        for (size_t j = blo; j < bhi; ++j) {
            size_t k = j - blo + 1;
            curr[k] = (a[i] == b[j]) ? prev[k - 1] + 1 : 0;
            if (curr[k] > best.size) {
                best = Block{i + 1 - curr[k], j + 1 - curr[k], curr[k]};
            }
        }
        std::swap(prev, curr);
        std::fill(curr.begin(), curr.end(), 0);
    }
    return best;
}

size_t matched_characters(std::string_view a, size_t alo, size_t ahi,
                          std::string_view b, size_t blo, size_t bhi) {
    if (alo >= ahi || blo >= bhi) return 0;
    Block m = longest_match(a, alo, ahi, b, blo, bhi);
    if (m.size == 0) return 0;
    return m.size + matched_characters(a, alo, m.a, b, blo, m.b) +
           matched_characters(a, m.a + m.size, ahi, b, m.b + m.size, bhi);
}

} // namespace

double token_jaccard(std::string_view a, std::string_view b) {
    auto wa = util::split_words(util::to_lower(a));
    auto wb = util::split_words(util::to_lower(b));
    std::set<std::string> sa(wa.begin(), wa.end());
    std::set<std::string> sb(wb.begin(), wb.end());
    if (sa.empty() && sb.empty()) return 1.0;

    std::vector<std::string> common;
    std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(common));
    size_t union_size = sa.size() + sb.size() - common.size();
    return static_cast<double>(common.size()) / static_cast<double>(union_size);
}

double sequence_ratio(std::string_view a, std::string_view b) {
    if (a.empty() && b.empty()) return 1.0;
    size_t matches = matched_characters(a, 0, a.size(), b, 0, b.size());
    return 2.0 * static_cast<double>(matches) / static_cast<double>(a.size() + b.size());
}

double lexical_score(std::string_view a, std::string_view b, double token_weight) {
    token_weight = std::clamp(token_weight, 0.0, 1.0);
    std::string la = util::to_lower(a);
    std::string lb = util::to_lower(b);
    double score = 100.0 * (token_weight * token_jaccard(la, lb) + (1.0 - token_weight) * sequence_ratio(la, lb));
    return std::clamp(score, 0.0, 100.0);
}

} // namespace dreamgroup::search
