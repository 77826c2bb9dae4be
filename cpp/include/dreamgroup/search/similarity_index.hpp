#pragma once

#include "dreamgroup/config.hpp"
#include "dreamgroup/store/cluster_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dreamgroup::search {

struct SearchHit {
    std::string cluster_id;
    std::string representative;
    size_t members = 0;
    double similarity = 0.0;   // 0..100
    bool lexical = false;      // produced by the lexical tier
};

// File names inside SearchConfig::index_dir
constexpr const char* kIndexFile = "phrases.hnsw";
constexpr const char* kMetaFile = "phrases_meta.json";

/**
 * Hybrid nearest-neighbour search over clusters.
 *
 * Vector tier: hnswlib inner-product index over unit phrase embeddings, built by build_index().
 * Hits are phrases; each is re-resolved to its cluster in the live store on every query, so
 * merged-away clusters never appear. Lexical tier: fills in when fewer than k vector hits clear
 * the threshold.
 */
class SimilarityIndex {
public:
    explicit SimilarityIndex(SearchConfig config);
    ~SimilarityIndex();

    SimilarityIndex(const SimilarityIndex&) = delete;
    SimilarityIndex& operator=(const SimilarityIndex&) = delete;

    // Load artifacts from config.index_dir; false (and available() false) when they are missing.
    // Corrupt artifacts throw DreamGroupException(INDEX_CORRUPT).
    bool load();

    bool available() const;
    size_t size() const;
    size_t dimensions() const;

    // Ranked hits excluding the query cluster; IndexUnavailableError when not loaded,
    // NOT_FOUND when the query cluster is not live
    std::vector<SearchHit> search(const store::ClusterStore& live, const std::string& query_cluster_id,
                                  size_t k, double threshold) const;

    std::vector<SearchHit> search(const store::ClusterStore& live, const std::string& query_cluster_id) const {
        return search(live, query_cluster_id, config_.default_k, config_.default_threshold);
    }

private:
    std::vector<SearchHit> vector_tier(const store::ClusterStore& live, const Cluster& query,
                                       size_t k, double threshold) const;
    std::vector<SearchHit> lexical_tier(const store::ClusterStore& live, const Cluster& query,
                                        const std::vector<SearchHit>& already, double threshold) const;

    SearchConfig config_;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dreamgroup::search
