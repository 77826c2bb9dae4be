// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dreamgroup/config.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <fstream>

using namespace dreamgroup;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* var : kEnv) unsetenv(var);
    }
    void TearDown() override {
        for (const char* var : kEnv) unsetenv(var);
    }

    std::string write_yaml(const std::string& text) {
        std::string path = dir_.file("dreamgroup.yaml");
        std::ofstream(path) << text;
        return path;
    }

    static constexpr const char* kEnv[] = {
        "GROQ_API_KEY", "DREAMGROUP_ORACLE_API_KEY", "DREAMGROUP_EMBEDDING_API_KEY", "DREAMGROUP_LOG_LEVEL"};
    test::TempDir dir_;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    Config config = load_config(dir_.file("absent.yaml"));
    EXPECT_EQ(config.oracle.host, "api.groq.com");
    EXPECT_EQ(config.oracle.call_delay_ms, 50u);
    EXPECT_EQ(config.clustering.window, 20u);
    EXPECT_EQ(config.clustering.prefix_chars, 3u);
    EXPECT_FALSE(config.clustering.prefilter_content_word);
    EXPECT_EQ(config.pipeline.checkpoint_every, 100u);
    EXPECT_EQ(config.search.default_k, 10u);
    EXPECT_DOUBLE_EQ(config.search.default_threshold, 70.0);
}

TEST_F(ConfigTest, YamlOverridesDefaults) {
    std::string path = write_yaml(
        "oracle:\n"
        "  host: localhost\n"
        "  port: 8080\n"
        "  use_ssl: false\n"
        "  call_delay_ms: 0\n"
        "pipeline:\n"
        "  corpus: dreams.tsv\n"
        "  checkpoint_every: 10\n"
        "clustering:\n"
        "  window: 5\n"
        "  prefix_chars: 0\n"
        "  prefilter_content_word: true\n"
        "search:\n"
        "  default_threshold: 55.5\n"
        "logging:\n"
        "  level: debug\n");

    Config config = load_config(path);
    EXPECT_EQ(config.oracle.host, "localhost");
    EXPECT_EQ(config.oracle.port, 8080);
    EXPECT_FALSE(config.oracle.use_ssl);
    EXPECT_EQ(config.oracle.call_delay_ms, 0u);
    EXPECT_EQ(config.pipeline.corpus_file, "dreams.tsv");
    EXPECT_EQ(config.pipeline.checkpoint_every, 10u);
    EXPECT_EQ(config.clustering.window, 5u);
    EXPECT_EQ(config.clustering.prefix_chars, 0u);
    EXPECT_TRUE(config.clustering.prefilter_content_word);
    EXPECT_DOUBLE_EQ(config.search.default_threshold, 55.5);
    EXPECT_EQ(config.logging.level, "debug");
    // Untouched sections keep their defaults
    EXPECT_EQ(config.embedding.model, "text-embedding-3-small");
}

TEST_F(ConfigTest, EnvironmentWinsOverFile) {
    std::string path = write_yaml("oracle:\n  api_key: from-file\n");
    setenv("DREAMGROUP_ORACLE_API_KEY", "from-env", 1);
    setenv("DREAMGROUP_LOG_LEVEL", "warn", 1);

    Config config = load_config(path);
    EXPECT_EQ(config.oracle.api_key, "from-env");
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    std::string path = write_yaml("oracle: [unterminated\n");
    try {
        load_config(path);
        FAIL() << "Expected ConfigError";
    } catch (const DreamGroupException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }
}

TEST_F(ConfigTest, RejectsZeroWindow) {
    std::string path = write_yaml("clustering:\n  window: 0\n");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST(LoggingTest, LevelNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("nonsense"), LogLevel::INFO);
}

TEST(LoggingTest, ApplyLoggingSetsLevel) {
    LoggingConfig logging;
    logging.level = "error";
    apply_logging(logging);
    EXPECT_EQ(Logger::instance().level(), LogLevel::ERROR);
    logging.level = "info";
    apply_logging(logging);
    EXPECT_EQ(Logger::instance().level(), LogLevel::INFO);
}
