#include "dreamgroup/config.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace dreamgroup {

namespace {

template<typename T>
void read_if(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) out = node[key].as<T>();
}

void read_service(const YAML::Node& node, ServiceConfig& svc) {
    read_if(node, "host", svc.host);
    read_if(node, "port", svc.port);
    read_if(node, "use_ssl", svc.use_ssl);
    read_if(node, "target", svc.target);
    read_if(node, "model", svc.model);
    read_if(node, "api_key", svc.api_key);
    read_if(node, "timeout_ms", svc.timeout_ms);
}

void set_if_env(std::string& value, const char* env_var) {
    const char* env_value = std::getenv(env_var);
    if (env_value && *env_value) {
        value = env_value;
    }
}

} // namespace

Config default_config() {
    Config config;

    config.oracle.host = "api.groq.com";
    config.oracle.port = 443;
    config.oracle.use_ssl = true;
    config.oracle.target = "/openai/v1/chat/completions";
    config.oracle.model = "llama-3.3-70b-versatile";
    config.oracle.timeout_ms = 30000;
    config.oracle.call_delay_ms = 50;

    config.embedding.host = "api.openai.com";
    config.embedding.port = 443;
    config.embedding.use_ssl = true;
    config.embedding.target = "/v1/embeddings";
    config.embedding.model = "text-embedding-3-small";
    config.embedding.timeout_ms = 60000;
    config.embedding.batch_size = 64;

    return config;
}

Config load_config(const std::string& config_file) {
    Config config = default_config();
    config.config_file = config_file;

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);

            if (yaml["oracle"]) {
                const auto& oracle = yaml["oracle"];
                read_service(oracle, config.oracle);
                read_if(oracle, "call_delay_ms", config.oracle.call_delay_ms);
            }

            if (yaml["embedding"]) {
                const auto& emb = yaml["embedding"];
                read_service(emb, config.embedding);
                read_if(emb, "batch_size", config.embedding.batch_size);
            }

            if (yaml["pipeline"]) {
                const auto& p = yaml["pipeline"];
                read_if(p, "corpus", config.pipeline.corpus_file);
                read_if(p, "checkpoint", config.pipeline.checkpoint_file);
                read_if(p, "output_dir", config.pipeline.output_dir);
                read_if(p, "status_file", config.pipeline.status_file);
                read_if(p, "checkpoint_every", config.pipeline.checkpoint_every);
                read_if(p, "max_records_per_run", config.pipeline.max_records_per_run);
                read_if(p, "reference_year", config.pipeline.reference_year);
            }

            if (yaml["clustering"]) {
                const auto& c = yaml["clustering"];
                read_if(c, "window", config.clustering.window);
                read_if(c, "prefix_chars", config.clustering.prefix_chars);
                read_if(c, "prefilter_content_word", config.clustering.prefilter_content_word);
                read_if(c, "checkpoint_every", config.clustering.checkpoint_every);
            }

            if (yaml["search"]) {
                const auto& s = yaml["search"];
                read_if(s, "index_dir", config.search.index_dir);
                read_if(s, "default_k", config.search.default_k);
                read_if(s, "default_threshold", config.search.default_threshold);
                read_if(s, "lexical_min_score", config.search.lexical_min_score);
                read_if(s, "token_weight", config.search.token_weight);
                read_if(s, "oversample", config.search.oversample);
                read_if(s, "ef_search", config.search.ef_search);
            }

            if (yaml["logging"]) {
                const auto& log = yaml["logging"];
                read_if(log, "level", config.logging.level);
                read_if(log, "file", config.logging.file);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError("Cannot parse " + config_file + ": " + e.what(), __func__);
        }
    } else if (!config_file.empty()) {
        LOG_INFO("Config file ", config_file, " not found, using defaults");
    }

    // Environment wins over the file so keys never need to live on disk
    set_if_env(config.oracle.api_key, "GROQ_API_KEY");
    set_if_env(config.oracle.api_key, "DREAMGROUP_ORACLE_API_KEY");
    set_if_env(config.embedding.api_key, "DREAMGROUP_EMBEDDING_API_KEY");
    set_if_env(config.logging.level, "DREAMGROUP_LOG_LEVEL");

    if (config.clustering.window == 0) {
        throw ConfigError("clustering.window must be at least 1", __func__);
    }
    if (config.pipeline.checkpoint_every == 0) {
        throw ConfigError("pipeline.checkpoint_every must be at least 1", __func__);
    }
    if (config.search.token_weight < 0.0 || config.search.token_weight > 1.0) {
        throw ConfigError("search.token_weight must lie in [0, 1]", __func__);
    }

    return config;
}

void apply_logging(const LoggingConfig& logging) {
    Logger::instance().set_level(parse_log_level(logging.level));
    if (!logging.file.empty()) {
        Logger::instance().set_output_file(logging.file);
    }
}

} // namespace dreamgroup
