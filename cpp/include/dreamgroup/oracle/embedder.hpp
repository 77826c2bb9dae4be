#pragma once

#include "dreamgroup/config.hpp"
#include "dreamgroup/oracle/http_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dreamgroup::oracle {

// Turns phrases into fixed-dimension vectors; one output row per input, in input order
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
};

/**
 * Embedder backed by an OpenAI-compatible /v1/embeddings endpoint.
 * Inputs are sent in batches of EmbeddingConfig::batch_size.
 */
class HttpEmbedder : public Embedder {
public:
    HttpEmbedder(EmbeddingConfig config, std::shared_ptr<HttpClient> http_client);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

    // Exposed for tests
    std::string build_request(const std::vector<std::string>& texts) const;
    static std::vector<std::vector<float>> parse_response(const std::string& body, size_t expected);

private:
    EmbeddingConfig config_;
    std::shared_ptr<HttpClient> http_client_;
};

} // namespace dreamgroup::oracle
