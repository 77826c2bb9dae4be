#pragma once

#include <cstdint>
#include <string>

namespace dreamgroup {

struct ServiceConfig {
    std::string host;
    uint16_t port = 443;
    bool use_ssl = true;
    std::string target;          // request path, e.g. /openai/v1/chat/completions
    std::string model;
    std::string api_key;
    uint32_t timeout_ms = 30000;
};

struct OracleConfig : ServiceConfig {
    uint32_t call_delay_ms = 50; // fixed pause before every outbound call
};

struct EmbeddingConfig : ServiceConfig {
    uint32_t batch_size = 64;
};

struct PipelineConfig {
    std::string corpus_file = "full_results.tsv";
    std::string checkpoint_file = "dreamgroup_checkpoint.json";
    std::string output_dir = "output";
    std::string status_file;          // empty = keep status in memory only
    uint32_t checkpoint_every = 100;  // records between checkpoints
    uint32_t max_records_per_run = 0; // 0 = no limit
    int reference_year = 0;           // 0 = current calendar year
};

struct ClusteringConfig {
    uint32_t window = 20;
    uint32_t prefix_chars = 3;
    bool prefilter_content_word = false; // key on the word after a leading "to" instead of the first word
    uint32_t checkpoint_every = 200;  // oracle comparisons between checkpoints
};

struct SearchConfig {
    std::string index_dir = "index";
    uint32_t default_k = 10;
    double default_threshold = 70.0;
    double lexical_min_score = 30.0;
    double token_weight = 0.6;        // remainder goes to character-sequence similarity
    uint32_t oversample = 5;
    uint32_t ef_search = 64;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    OracleConfig oracle;
    EmbeddingConfig embedding;
    PipelineConfig pipeline;
    ClusteringConfig clustering;
    SearchConfig search;
    LoggingConfig logging;
    std::string config_file;
};

// Built-in defaults (Groq chat completions, OpenAI embeddings)
Config default_config();

// Load configuration from a YAML file, then apply environment overrides.
// A missing file yields the defaults; a malformed one throws ConfigError.
Config load_config(const std::string& config_file = "dreamgroup.yaml");

// Apply logging settings to the process logger
void apply_logging(const LoggingConfig& logging);

} // namespace dreamgroup
