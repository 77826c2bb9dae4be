#include "dreamgroup/oracle/chat_oracle.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/util/text.hpp"

#include <boost/json.hpp>

#include <regex>
#include <thread>

namespace dreamgroup::oracle {

ChatCompletionOracle::ChatCompletionOracle(OracleConfig config, std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config))
    , http_client_(std::move(http_client)) {
    DREAMGROUP_CHECK_ARGUMENT(http_client_ != nullptr, "HTTP client is required");
    if (config_.api_key.empty()) {
        LOG_WARN("No API key configured for ", config_.host, "; requests will likely be rejected");
    }
}

void ChatCompletionOracle::pace() {
    if (config_.call_delay_ms == 0) return;
    const auto delay = std::chrono::milliseconds(config_.call_delay_ms);
    const auto since_last = std::chrono::steady_clock::now() - last_call_;
    if (since_last < delay) {
        std::this_thread::sleep_for(delay - since_last);
    }
}

std::string ChatCompletionOracle::complete(const OracleRequest& request) {
    pace();
    last_call_ = std::chrono::steady_clock::now();
    ++calls_;

    LOG_TRACE("Oracle ", operation_kind_name(request.kind), " request: ", request.prompt.substr(0, 80));

    HttpResponse response = http_client_->post_json(config_, build_request(request));
    if (response.status == 429) {
        throw OracleError("Rate limited by " + config_.host, __func__);
    }
    if (!response.ok()) {
        throw OracleError("HTTP " + std::to_string(response.status) + " from " + config_.host + ": " +
                          response.body.substr(0, 200), __func__);
    }

    std::string text = parse_response(response.body);
    LOG_TRACE("Oracle ", operation_kind_name(request.kind), " reply: ", text);
    return text;
}

std::string ChatCompletionOracle::build_request(const OracleRequest& request) const {
    boost::json::object root;

    boost::json::array messages;
    boost::json::object message;
    message["role"] = "user";
    message["content"] = request.prompt;
    messages.push_back(std::move(message));
    root["messages"] = std::move(messages);

    root["model"] = config_.model;
    root["temperature"] = request.temperature;
    root["max_tokens"] = request.max_tokens;

    return boost::json::serialize(root);
}

std::string ChatCompletionOracle::parse_response(const std::string& body) {
    boost::json::value val;
    try {
        val = boost::json::parse(body);
    } catch (const std::exception& e) {
        throw OracleError("Invalid JSON in chat completion response: " + std::string(e.what()),
                          __func__, ErrorCode::ORACLE_BAD_RESPONSE);
    }

    const boost::json::object* root = val.if_object();
    const boost::json::value* choices_value = root ? root->if_contains("choices") : nullptr;
    const boost::json::array* choices = choices_value ? choices_value->if_array() : nullptr;
    if (!choices || choices->empty()) {
        throw OracleError("Chat completion response has no choices", __func__,
                          ErrorCode::ORACLE_BAD_RESPONSE);
    }

    const boost::json::object* choice = (*choices)[0].if_object();
    const boost::json::value* message_value = choice ? choice->if_contains("message") : nullptr;
    const boost::json::object* message = message_value ? message_value->if_object() : nullptr;
    if (!message) {
        throw OracleError("Chat completion choice has no message", __func__,
                          ErrorCode::ORACLE_BAD_RESPONSE);
    }

    if (const auto* content = message->if_contains("content"); content && content->is_string()) {
        std::string text(content->get_string().c_str());
        if (!util::trim(text).empty()) return text;
    }
    if (const auto* reasoning = message->if_contains("reasoning"); reasoning && reasoning->is_string()) {
        return extract_from_reasoning(reasoning->get_string().c_str());
    }
    return "";
}

std::string ChatCompletionOracle::extract_from_reasoning(const std::string& reasoning) {
    static const std::regex patterns[] = {
        std::regex(R"(answer:\s*"([^"]+)\")", std::regex::icase),
        std::regex(R"(means\s+"([^"]+)\")", std::regex::icase),
        std::regex(R"(translation:\s*"([^"]+)\")", std::regex::icase),
        std::regex(R"("([^"]+)\"\s*$)"),
    };
    for (const auto& pattern : patterns) {
        std::smatch match;
        if (std::regex_search(reasoning, match, pattern)) {
            return match[1].str();
        }
    }
    return "";
}

} // namespace dreamgroup::oracle
