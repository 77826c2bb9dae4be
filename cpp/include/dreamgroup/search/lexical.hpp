#pragma once

#include <string_view>

namespace dreamgroup::search {

// |A ∩ B| / |A ∪ B| over lower-cased word sets; 1.0 when both are empty
double token_jaccard(std::string_view a, std::string_view b);

// Ratcliff/Obershelp ratio 2*M / (|a| + |b|), M = characters in recursively matched blocks
double sequence_ratio(std::string_view a, std::string_view b);

// 100 * (token_weight * jaccard + (1 - token_weight) * sequence ratio), in [0, 100]
double lexical_score(std::string_view a, std::string_view b, double token_weight = 0.6);

} // namespace dreamgroup::search
