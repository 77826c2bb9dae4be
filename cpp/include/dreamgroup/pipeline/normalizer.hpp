#pragma once

#include "dreamgroup/oracle/oracle_cache.hpp"
#include "dreamgroup/oracle/text_oracle.hpp"
#include "dreamgroup/pipeline/response_parser.hpp"
#include "dreamgroup/util/utf8.hpp"

#include <string>
#include <string_view>

namespace dreamgroup::pipeline {

// Strategies for recovering the English phrase from a normalization reply.
// Spans containing characters of the source script are never accepted.
ResponseParser<std::string> make_normalization_parser(util::Script source);

/**
 * Reduces a raw dream title in any script to a canonical English "to <verb> <object>" phrase.
 *
 * The oracle does the translation and detail stripping; anything it gets wrong (exception,
 * empty or unusable reply) is replaced by a deterministic fallback, so normalize() never
 * returns an empty string. Results, fallbacks included, are cached by trimmed input.
 */
class Normalizer {
public:
    Normalizer(oracle::TextOracle& oracle, oracle::OracleCache& cache);

    // Throws InvalidArgumentError on blank input
    std::string normalize(const std::string& raw);

    size_t oracle_calls() const { return oracle_calls_; }
    size_t fallbacks() const { return fallbacks_; }

    static std::string build_prompt(std::string_view raw, util::Script script);

    // Clean an extracted candidate into canonical form; may return a too-short or empty string
    static std::string canonicalize(std::string_view candidate);

    // Trimmed, lower-cased input prefixed with "to " when it lacks it
    static std::string fallback(std::string_view raw);

private:
    std::string normalize_uncached(const std::string& raw);

    oracle::TextOracle& oracle_;
    oracle::OracleCache& cache_;
    size_t oracle_calls_ = 0;
    size_t fallbacks_ = 0;
};

} // namespace dreamgroup::pipeline
