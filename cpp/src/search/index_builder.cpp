#include "dreamgroup/search/index_builder.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/search/similarity_index.hpp"

#include <boost/json.hpp>
#include <hnswlib/hnswlib.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

namespace dreamgroup::search {

namespace {

constexpr size_t kHnswM = 16;
constexpr size_t kHnswEfConstruction = 200;

void replace_file(const fs::path& tmp, const fs::path& target) {
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Cannot rename " + tmp.string() + ": " + ec.message());
    }
}

} // namespace

std::vector<std::string> distinct_phrases(const pipeline::PipelineState& state) {
    std::set<std::string> phrases;
    for (const auto& r : state.records) {
        if (r.normalized()) phrases.insert(r.normalized_phrase);
    }
    return std::vector<std::string>(phrases.begin(), phrases.end());
}

IndexBuildStats build_index(const pipeline::PipelineState& state, oracle::Embedder& embedder,
                            const SearchConfig& config) {
    auto start = std::chrono::steady_clock::now();

    std::vector<std::string> phrases = distinct_phrases(state);
    DREAMGROUP_CHECK_ARGUMENT(!phrases.empty(), "No normalized phrases to index; run the pipeline first");

    LOG_INFO("Embedding ", phrases.size(), " distinct phrases");
    std::vector<std::vector<float>> embeddings = embedder.embed(phrases);
    DREAMGROUP_CHECK(embeddings.size() == phrases.size(), ErrorCode::ORACLE_BAD_RESPONSE,
                     "Embedder returned " + std::to_string(embeddings.size()) + " vectors for " +
                     std::to_string(phrases.size()) + " phrases");

    const size_t dim = embeddings.front().size();
    DREAMGROUP_CHECK(dim > 0, ErrorCode::ORACLE_BAD_RESPONSE, "Embedder returned empty vectors");

    // Normalize for cosine similarity
    for (auto& v : embeddings) {
        DREAMGROUP_CHECK(v.size() == dim, ErrorCode::ORACLE_BAD_RESPONSE, "Embedding dimensions differ");
        float norm = 0;
        for (float x : v) norm += x * x;
        norm = std::sqrt(norm);
        if (norm > 0) {
            for (float& x : v) x /= norm;
        }
    }

    hnswlib::InnerProductSpace space(dim);
    hnswlib::HierarchicalNSW<float> hnsw(&space, phrases.size(), kHnswM, kHnswEfConstruction);
    for (size_t i = 0; i < embeddings.size(); ++i) {
        hnsw.addPoint(embeddings[i].data(), i);
    }

    const fs::path dir(config.index_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Cannot create " + dir.string() + ": " + ec.message());
    }

    IndexBuildStats stats;
    stats.phrases = phrases.size();
    stats.dimensions = dim;
    stats.index_path = (dir / kIndexFile).string();
    stats.meta_path = (dir / kMetaFile).string();

    const std::string index_tmp = stats.index_path + ".tmp";
    hnsw.saveIndex(index_tmp);

    boost::json::object meta;
    meta["dimensions"] = dim;
    boost::json::array entries;
    for (size_t i = 0; i < phrases.size(); ++i) {
        boost::json::object entry;
        entry["label"] = i;
        entry["phrase"] = phrases[i];
        entries.push_back(std::move(entry));
    }
    meta["entries"] = std::move(entries);

    const std::string meta_tmp = stats.meta_path + ".tmp";
    {
        std::ofstream out(meta_tmp, std::ios::binary | std::ios::trunc);
        out << boost::json::serialize(meta);
        if (!out) {
            DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Failed writing " + meta_tmp);
        }
    }

    replace_file(index_tmp, stats.index_path);
    replace_file(meta_tmp, stats.meta_path);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Built similarity index: ", stats.phrases, " phrases x ", dim, " dims in ", ms, "ms");
    return stats;
}

} // namespace dreamgroup::search
