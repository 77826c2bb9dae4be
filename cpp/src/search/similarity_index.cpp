#include "dreamgroup/search/similarity_index.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/search/lexical.hpp"

#include <boost/json.hpp>
#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

namespace dreamgroup::search {

class SimilarityIndex::Impl {
public:
    size_t dim = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
    std::unordered_map<size_t, std::string> phrase_by_label;
    std::unordered_map<std::string, size_t> label_by_phrase;

    void reset() {
        hnsw.reset();
        space.reset();
        phrase_by_label.clear();
        label_by_phrase.clear();
        dim = 0;
    }
};

SimilarityIndex::SimilarityIndex(SearchConfig config)
    : config_(std::move(config))
    , pImpl(std::make_unique<Impl>()) {}

SimilarityIndex::~SimilarityIndex() = default;

bool SimilarityIndex::load() {
    pImpl->reset();

    const fs::path dir(config_.index_dir);
    const fs::path index_path = dir / kIndexFile;
    const fs::path meta_path = dir / kMetaFile;

    std::error_code ec;
    if (!fs::exists(index_path, ec) || !fs::exists(meta_path, ec)) {
        LOG_WARN("Similarity index not found in ", dir.string(), "; search unavailable");
        return false;
    }

    std::ifstream in(meta_path, std::ios::binary);
    if (!in) {
        DREAMGROUP_THROW(ErrorCode::INDEX_CORRUPT, "Cannot open " + meta_path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        boost::json::value doc = boost::json::parse(buffer.str());
        const auto& root = doc.as_object();
        pImpl->dim = root.at("dimensions").to_number<size_t>();
        for (const auto& entry : root.at("entries").as_array()) {
            const auto& obj = entry.as_object();
            size_t label = obj.at("label").to_number<size_t>();
            std::string phrase(obj.at("phrase").as_string().c_str());
            pImpl->label_by_phrase.emplace(phrase, label);
            pImpl->phrase_by_label.emplace(label, std::move(phrase));
        }
    } catch (const std::exception& e) {
        pImpl->reset();
        DREAMGROUP_THROW(ErrorCode::INDEX_CORRUPT, "Malformed " + meta_path.string() + ": " + e.what());
    }
    if (pImpl->dim == 0) {
        pImpl->reset();
        DREAMGROUP_THROW(ErrorCode::INDEX_CORRUPT, "Index metadata has zero dimensions");
    }

    try {
        pImpl->space = std::make_unique<hnswlib::InnerProductSpace>(pImpl->dim);
        pImpl->hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(pImpl->space.get(), index_path.string());
        pImpl->hnsw->setEf(config_.ef_search);
    } catch (const std::exception& e) {
        pImpl->reset();
        DREAMGROUP_THROW(ErrorCode::INDEX_CORRUPT, "Cannot load " + index_path.string() + ": " + e.what());
    }

    if (pImpl->hnsw->getCurrentElementCount() != pImpl->phrase_by_label.size()) {
        size_t stored = pImpl->hnsw->getCurrentElementCount();
        pImpl->reset();
        DREAMGROUP_THROW(ErrorCode::INDEX_CORRUPT,
                         "Index holds " + std::to_string(stored) + " vectors but metadata lists a different count");
    }

    LOG_INFO("Loaded similarity index: ", pImpl->phrase_by_label.size(), " phrases, ", pImpl->dim, " dimensions");
    return true;
}

bool SimilarityIndex::available() const {
    return pImpl->hnsw != nullptr;
}

size_t SimilarityIndex::size() const {
    return pImpl->phrase_by_label.size();
}

size_t SimilarityIndex::dimensions() const {
    return pImpl->dim;
}

std::vector<SearchHit> SimilarityIndex::search(const store::ClusterStore& live, const std::string& query_cluster_id,
                                               size_t k, double threshold) const {
    if (!available()) {
        throw IndexUnavailableError("Similarity index is not loaded", __func__);
    }
    const Cluster* query = live.find(query_cluster_id);
    if (!query) {
        throw DreamGroupException(ErrorCode::NOT_FOUND, "Cluster " + query_cluster_id + " is not live", __func__);
    }
    if (k == 0) return {};

    std::vector<SearchHit> hits = vector_tier(live, *query, k, threshold);
    if (hits.size() < k) {
        auto lexical = lexical_tier(live, *query, hits, threshold);
        hits.insert(hits.end(), lexical.begin(), lexical.end());
    }

    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        if (a.members != b.members) return a.members > b.members;
        return a.cluster_id < b.cluster_id;
    });
    if (hits.size() > k) hits.resize(k);
    return hits;
}

std::vector<SearchHit> SimilarityIndex::vector_tier(const store::ClusterStore& live, const Cluster& query,
                                                    size_t k, double threshold) const {
    // Representative first, then any member phrase the index knows
    std::vector<float> query_vector;
    for (const auto& phrase : live.member_phrases(query.id)) {
        auto it = pImpl->label_by_phrase.find(phrase);
        if (it == pImpl->label_by_phrase.end()) continue;
        query_vector = pImpl->hnsw->getDataByLabel<float>(it->second);
        break;
    }
    if (query_vector.empty()) {
        LOG_DEBUG("No indexed phrase for ", query.id, "; lexical search only");
        return {};
    }

    size_t wanted = std::min(size(), k * std::max<size_t>(config_.oversample, 1) + query.size() + 1);
    auto result = pImpl->hnsw->searchKnn(query_vector.data(), wanted);

    std::unordered_map<std::string, SearchHit> best;
    while (!result.empty()) {
        auto [distance, label] = result.top();
        result.pop();

        auto phrase = pImpl->phrase_by_label.find(label);
        if (phrase == pImpl->phrase_by_label.end()) continue;
        const Cluster* cluster = live.find_by_phrase(phrase->second);
        if (!cluster || cluster->id == query.id) continue;

        double similarity = std::clamp(100.0 * (1.0 - static_cast<double>(distance)), 0.0, 100.0);
        if (similarity < threshold) continue;

        auto& hit = best[cluster->id];
        if (hit.cluster_id.empty() || similarity > hit.similarity) {
            hit = SearchHit{cluster->id, cluster->representative, cluster->size(), similarity, false};
        }
    }

    std::vector<SearchHit> hits;
    hits.reserve(best.size());
    for (auto& [id, hit] : best) hits.push_back(std::move(hit));
    return hits;
}

std::vector<SearchHit> SimilarityIndex::lexical_tier(const store::ClusterStore& live, const Cluster& query,
                                                     const std::vector<SearchHit>& already, double threshold) const {
    const double gate = std::max(threshold, config_.lexical_min_score);

    std::vector<SearchHit> hits;
    for (const auto& cluster : live.clusters()) {
        if (cluster.id == query.id) continue;
        bool seen = std::any_of(already.begin(), already.end(),
                                [&](const SearchHit& h) { return h.cluster_id == cluster.id; });
        if (seen) continue;

        double score = lexical_score(query.representative, cluster.representative, config_.token_weight);
        if (score >= gate) {
            hits.push_back(SearchHit{cluster.id, cluster.representative, cluster.size(), score, true});
        }
    }
    return hits;
}

} // namespace dreamgroup::search
