#pragma once

#include <stdexcept>
#include <string>

namespace dreamgroup {

/**
 * Structured error reporting for the grouping pipeline.
 * Every exception carries a code, the function it was raised from and an optional hint.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_FOUND = 2,

    // Oracle errors
    ORACLE_UNAVAILABLE = 100,
    ORACLE_TIMEOUT = 101,
    ORACLE_BAD_RESPONSE = 102,

    // Persistence errors
    CHECKPOINT_READ_FAILED = 200,
    CHECKPOINT_WRITE_FAILED = 201,
    EXPORT_FAILED = 202,

    // Input errors
    CORPUS_UNREADABLE = 300,
    CONFIG_INVALID = 301,

    // Search errors
    INDEX_UNAVAILABLE = 400,
    INDEX_CORRUPT = 401,

    // Internal errors
    INTERNAL_ERROR = 500
};

class DreamGroupException : public std::runtime_error {
public:
    explicit DreamGroupException(ErrorCode code, const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "dreamgroup error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += " (in " + context + ")";
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public DreamGroupException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : DreamGroupException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class OracleError : public DreamGroupException {
public:
    explicit OracleError(const std::string& message,
                         const std::string& context = "",
                         ErrorCode code = ErrorCode::ORACLE_UNAVAILABLE)
        : DreamGroupException(code, message, context) {}
};

class CheckpointError : public DreamGroupException {
public:
    explicit CheckpointError(const std::string& message,
                             const std::string& context = "",
                             ErrorCode code = ErrorCode::CHECKPOINT_WRITE_FAILED)
        : DreamGroupException(code, message, context,
                              "Fix or remove the checkpoint file before resuming") {}
};

class CorpusError : public DreamGroupException {
public:
    explicit CorpusError(const std::string& message, const std::string& context = "")
        : DreamGroupException(ErrorCode::CORPUS_UNREADABLE, message, context) {}
};

class ConfigError : public DreamGroupException {
public:
    explicit ConfigError(const std::string& message, const std::string& context = "")
        : DreamGroupException(ErrorCode::CONFIG_INVALID, message, context) {}
};

class IndexUnavailableError : public DreamGroupException {
public:
    explicit IndexUnavailableError(const std::string& message, const std::string& context = "")
        : DreamGroupException(ErrorCode::INDEX_UNAVAILABLE, message, context,
                              "Run `dreamgroup build-index` first") {}
};

// Macros for common error checking
#define DREAMGROUP_CHECK(condition, code, message) \
    do { if (!(condition)) throw dreamgroup::DreamGroupException(code, message, __func__); } while (0)

#define DREAMGROUP_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw dreamgroup::InvalidArgumentError(message, __func__); } while (0)

#define DREAMGROUP_THROW(code, message) \
    throw dreamgroup::DreamGroupException(code, message, __func__)

} // namespace dreamgroup
