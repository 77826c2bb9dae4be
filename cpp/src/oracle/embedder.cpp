#include "dreamgroup/oracle/embedder.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"

#include <boost/json.hpp>

#include <algorithm>

namespace dreamgroup::oracle {

HttpEmbedder::HttpEmbedder(EmbeddingConfig config, std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config))
    , http_client_(std::move(http_client)) {
    DREAMGROUP_CHECK_ARGUMENT(http_client_ != nullptr, "HTTP client is required");
    if (config_.batch_size == 0) config_.batch_size = 1;
}

std::vector<std::vector<float>> HttpEmbedder::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> result;
    result.reserve(texts.size());

    for (size_t start = 0; start < texts.size(); start += config_.batch_size) {
        size_t end = std::min(texts.size(), start + config_.batch_size);
        std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

        LOG_DEBUG("Embedding batch ", start, "-", end, " of ", texts.size());
        HttpResponse response = http_client_->post_json(config_, build_request(batch));
        if (!response.ok()) {
            throw OracleError("Embedding request failed with HTTP " + std::to_string(response.status) +
                              ": " + response.body.substr(0, 200), __func__);
        }

        auto vectors = parse_response(response.body, batch.size());
        for (auto& v : vectors) result.push_back(std::move(v));
    }
    return result;
}

std::string HttpEmbedder::build_request(const std::vector<std::string>& texts) const {
    boost::json::object root;

    boost::json::array input_array;
    for (const auto& text : texts) {
        input_array.push_back(boost::json::string(text));
    }
    root["input"] = std::move(input_array);
    root["model"] = config_.model;
    root["encoding_format"] = "float";

    return boost::json::serialize(root);
}

std::vector<std::vector<float>> HttpEmbedder::parse_response(const std::string& body, size_t expected) {
    try {
        boost::json::value val = boost::json::parse(body);
        const boost::json::array& data = val.as_object().at("data").as_array();
        if (data.size() != expected) {
            throw OracleError("Expected " + std::to_string(expected) + " embeddings, got " +
                              std::to_string(data.size()), __func__, ErrorCode::ORACLE_BAD_RESPONSE);
        }

        std::vector<std::vector<float>> result(expected);
        size_t dim = 0;
        for (size_t i = 0; i < data.size(); ++i) {
            const boost::json::object& item = data[i].as_object();
            // Providers may reorder; "index" is authoritative when present
            size_t slot = i;
            if (const auto* index = item.if_contains("index")) {
                slot = static_cast<size_t>(index->to_number<int64_t>());
            }
            if (slot >= expected || !result[slot].empty()) {
                throw OracleError("Bad embedding index " + std::to_string(slot), __func__,
                                  ErrorCode::ORACLE_BAD_RESPONSE);
            }

            const boost::json::array& embedding = item.at("embedding").as_array();
            std::vector<float>& row = result[slot];
            row.reserve(embedding.size());
            for (const auto& component : embedding) {
                row.push_back(static_cast<float>(component.to_number<double>()));
            }
            if (row.empty() || (dim != 0 && row.size() != dim)) {
                throw OracleError("Inconsistent embedding dimension", __func__,
                                  ErrorCode::ORACLE_BAD_RESPONSE);
            }
            dim = row.size();
        }
        return result;
    } catch (const OracleError&) {
        throw;
    } catch (const std::exception& e) {
        throw OracleError("Invalid embedding response: " + std::string(e.what()), __func__,
                          ErrorCode::ORACLE_BAD_RESPONSE);
    }
}

} // namespace dreamgroup::oracle
