// =============================================================================
// Shared fixtures for the dreamgroup tests
// =============================================================================

#pragma once

#include <gmock/gmock.h>

#include "dreamgroup/oracle/embedder.hpp"
#include "dreamgroup/oracle/http_client.hpp"
#include "dreamgroup/oracle/text_oracle.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace dreamgroup::test {

class MockTextOracle : public oracle::TextOracle {
public:
    MOCK_METHOD(std::string, complete, (const oracle::OracleRequest&), (override));
};

class MockEmbedder : public oracle::Embedder {
public:
    MOCK_METHOD(std::vector<std::vector<float>>, embed, (const std::vector<std::string>&), (override));
};

class MockHttpClient : public oracle::HttpClient {
public:
    MOCK_METHOD(oracle::HttpResponse, post_json,
                (const ServiceConfig&, const std::string&, const oracle::HttpHeaders&), (override));
};

// Oracle driven by a plain function; records every request it sees
class ScriptedOracle : public oracle::TextOracle {
public:
    using Responder = std::function<std::string(const oracle::OracleRequest&)>;

    explicit ScriptedOracle(Responder responder) : responder_(std::move(responder)) {}

    std::string complete(const oracle::OracleRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        return responder_(request);
    }

    size_t count(oracle::OperationKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) n += r.kind == kind ? 1 : 0;
        return n;
    }

    size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    Responder responder_;
    mutable std::mutex mutex_;
    std::vector<oracle::OracleRequest> requests_;
};

// Text between the first occurrence of `open` and the next `close`
inline std::string between(const std::string& text, const std::string& open, const std::string& close) {
    size_t start = text.find(open);
    if (start == std::string::npos) return "";
    start += open.size();
    size_t end = text.find(close, start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("dreamgroup_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace dreamgroup::test
