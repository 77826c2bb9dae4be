#pragma once

#include "dreamgroup/config.hpp"
#include "dreamgroup/oracle/http_client.hpp"
#include "dreamgroup/oracle/text_oracle.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace dreamgroup::oracle {

/**
 * TextOracle backed by an OpenAI-compatible chat-completions endpoint (Groq by default).
 *
 * Each prompt is sent as a single user message. Calls are spaced by a fixed delay
 * (OracleConfig::call_delay_ms) to stay under the provider's rate limits; there is no retry.
 */
class ChatCompletionOracle : public TextOracle {
public:
    ChatCompletionOracle(OracleConfig config, std::shared_ptr<HttpClient> http_client);

    std::string complete(const OracleRequest& request) override;

    size_t calls() const { return calls_; }

    // Exposed for tests
    std::string build_request(const OracleRequest& request) const;
    static std::string parse_response(const std::string& body);

    // Reasoning models sometimes leave "content" empty and put the answer in "reasoning"
    static std::string extract_from_reasoning(const std::string& reasoning);

private:
    void pace();

    OracleConfig config_;
    std::shared_ptr<HttpClient> http_client_;
    std::chrono::steady_clock::time_point last_call_{};
    size_t calls_ = 0;
};

} // namespace dreamgroup::oracle
