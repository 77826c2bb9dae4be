#pragma once

#include "dreamgroup/oracle/oracle_cache.hpp"
#include "dreamgroup/oracle/text_oracle.hpp"

#include <string>
#include <string_view>

namespace dreamgroup::pipeline {

/**
 * Pairwise "same dream?" judgement between two canonical phrases.
 *
 * Identical strings are equivalent without asking. Otherwise the oracle gets a forced yes/no
 * prompt; verdicts are cached by unordered pair so each distinct pair is asked at most once.
 * A failed call answers false and is not cached, so a later run may ask again.
 */
class EquivalenceJudge {
public:
    EquivalenceJudge(oracle::TextOracle& oracle, oracle::OracleCache& cache);

    bool equivalent(const std::string& a, const std::string& b);

    size_t oracle_calls() const { return oracle_calls_; }
    size_t failures() const { return failures_; }

    static std::string build_prompt(std::string_view a, std::string_view b);

    // True only when the first meaningful token of the reply starts with 'y'
    static bool parse_verdict(std::string_view reply);

private:
    oracle::TextOracle& oracle_;
    oracle::OracleCache& cache_;
    size_t oracle_calls_ = 0;
    size_t failures_ = 0;
};

} // namespace dreamgroup::pipeline
