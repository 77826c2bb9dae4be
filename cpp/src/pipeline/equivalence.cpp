#include "dreamgroup/pipeline/equivalence.hpp"
#include "dreamgroup/logging.hpp"

namespace dreamgroup::pipeline {

namespace {

constexpr const char* kYes = "1";
constexpr const char* kNo = "0";

bool is_noise(char c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\r':
        case '"': case '\'': case '`': case '*': case '_':
        case '.': case ',': case ':': case ';': case '!': case '-':
        case '(': case ')': case '[': case ']':
            return true;
        default:
            return false;
    }
}

} // namespace

EquivalenceJudge::EquivalenceJudge(oracle::TextOracle& oracle, oracle::OracleCache& cache)
    : oracle_(oracle)
    , cache_(cache) {}

bool EquivalenceJudge::equivalent(const std::string& a, const std::string& b) {
    if (a == b) return true;

    const std::string key = oracle::OracleCache::pair_key(a, b);
    if (auto cached = cache_.get(oracle::OperationKind::EQUIVALENCE, key)) {
        return *cached == kYes;
    }

    oracle::OracleRequest request;
    request.kind = oracle::OperationKind::EQUIVALENCE;
    request.prompt = build_prompt(a, b);
    request.temperature = 0.0;
    request.max_tokens = 2;

    std::string reply;
    try {
        ++oracle_calls_;
        reply = oracle_.complete(request);
    } catch (const std::exception& e) {
        ++failures_;
        LOG_WARN("Equivalence oracle failed for '", a, "' / '", b, "': ", e.what());
        return false;
    }

    bool verdict = parse_verdict(reply);
    cache_.put(oracle::OperationKind::EQUIVALENCE, key, verdict ? kYes : kNo);
    LOG_DEBUG("'", a, "' ~ '", b, "': ", verdict ? "yes" : "no");
    return verdict;
}

std::string EquivalenceJudge::build_prompt(std::string_view a, std::string_view b) {
    std::string prompt = "Are these two dreams essentially the same? '";
    prompt.append(a);
    prompt += "' and '";
    prompt.append(b);
    prompt += "'\nReply with ONLY 'y' for yes or 'n' for no.";
    return prompt;
}

bool EquivalenceJudge::parse_verdict(std::string_view reply) {
    for (char c : reply) {
        if (is_noise(c)) continue;
        return c == 'y' || c == 'Y';
    }
    return false;
}

} // namespace dreamgroup::pipeline
