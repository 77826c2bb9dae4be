#pragma once

#include "dreamgroup/oracle/oracle_cache.hpp"
#include "dreamgroup/oracle/text_oracle.hpp"
#include "dreamgroup/pipeline/response_parser.hpp"
#include "dreamgroup/types.hpp"

#include <string>
#include <string_view>

namespace dreamgroup::pipeline {

// strict_triplet, embedded_triplet, labelled_lines
ResponseParser<TaxonomyPath> make_taxonomy_parser();

/**
 * Assigns a Category / Subcategory / Specific path to a cluster representative.
 * classify() is total: any oracle failure or unusable reply falls back to the keyword table.
 */
class TaxonomyClassifier {
public:
    TaxonomyClassifier(oracle::TextOracle& oracle, oracle::OracleCache& cache);

    TaxonomyPath classify(const std::string& phrase);

    size_t oracle_calls() const { return oracle_calls_; }
    size_t fallbacks() const { return fallbacks_; }

    static std::string build_prompt(std::string_view phrase);

    // Keyword table; first matching row wins, keywords match at the start of a word
    static TaxonomyPath fallback(std::string_view phrase);

    static std::string encode(const TaxonomyPath& path);
    static std::optional<TaxonomyPath> decode(std::string_view text);

private:
    TaxonomyPath classify_uncached(const std::string& phrase);

    oracle::TextOracle& oracle_;
    oracle::OracleCache& cache_;
    size_t oracle_calls_ = 0;
    size_t fallbacks_ = 0;
};

} // namespace dreamgroup::pipeline
