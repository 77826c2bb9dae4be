#pragma once

#include <string>

namespace dreamgroup::oracle {

// What a prompt is for; doubles as the cache namespace
enum class OperationKind {
    NORMALIZE,
    EQUIVALENCE,
    TAXONOMY
};

const char* operation_kind_name(OperationKind kind);
OperationKind parse_operation_kind(const std::string& name);

struct OracleRequest {
    OperationKind kind = OperationKind::NORMALIZE;
    std::string prompt;
    double temperature = 0.1;
    int max_tokens = 100;
};

/**
 * A text-generation service: prompt in, text out.
 * Implementations may throw (OracleError or anything derived from std::exception),
 * return empty text or return malformed text; callers must tolerate all three.
 */
class TextOracle {
public:
    virtual ~TextOracle() = default;

    virtual std::string complete(const OracleRequest& request) = 0;
};

} // namespace dreamgroup::oracle
