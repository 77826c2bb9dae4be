#include "dreamgroup/pipeline/clustering.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/util/text.hpp"
#include "dreamgroup/util/utf8.hpp"

#include <algorithm>
#include <unordered_map>

namespace dreamgroup::pipeline {

ClusteringOptions ClusteringOptions::from_config(const ClusteringConfig& config) {
    ClusteringOptions options;
    options.window = config.window;
    options.prefix_chars = config.prefix_chars;
    options.content_word = config.prefilter_content_word;
    options.checkpoint_every = config.checkpoint_every;
    return options;
}

ClusteringEngine::ClusteringEngine(EquivalenceJudge& judge, ClusteringOptions options)
    : judge_(judge)
    , options_(options) {
    DREAMGROUP_CHECK_ARGUMENT(options_.window > 0, "Merge window must be at least 1");
    if (options_.checkpoint_every == 0) options_.checkpoint_every = 1;
}

std::vector<Cluster> ClusteringEngine::exact_pass(std::vector<DreamRecord>& records) const {
    std::vector<Cluster> clusters;
    std::unordered_map<std::string, size_t> by_phrase;

    for (auto& record : records) {
        DREAMGROUP_CHECK(record.normalized(), ErrorCode::INTERNAL_ERROR,
                         "Record " + record.id + " reached clustering without a normalized phrase");

        auto [it, inserted] = by_phrase.emplace(record.normalized_phrase, clusters.size());
        if (inserted) {
            Cluster cluster;
            cluster.id = format_cluster_id(clusters.size() + 1);
            cluster.representative = record.normalized_phrase;
            clusters.push_back(std::move(cluster));
        }
        Cluster& cluster = clusters[it->second];
        cluster.member_ids.push_back(record.id);
        record.cluster_id = cluster.id;
    }

    LOG_INFO("Exact pass: ", records.size(), " records -> ", clusters.size(), " clusters");
    return clusters;
}

MergeStats ClusteringEngine::merge_pass(std::vector<Cluster>& clusters, std::vector<DreamRecord>& records,
                                        const ProgressHook& hook) {
    MergeStats stats;

    std::unordered_map<std::string, size_t> record_index;
    record_index.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) record_index.emplace(records[i].id, i);

    std::sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        if (a.representative != b.representative) return a.representative < b.representative;
        return a.id < b.id;
    });

    std::vector<std::string> keys;
    keys.reserve(clusters.size());
    for (const auto& c : clusters) keys.push_back(prefilter_key(c.representative, options_.prefix_chars, options_.content_word));

    for (size_t i = 0; i < clusters.size(); ++i) {
        size_t examined = 0;
        size_t j = i + 1;
        while (j < clusters.size() && examined < options_.window) {
            ++examined;

            if (options_.prefix_chars > 0 && keys[i] != keys[j]) {
                ++stats.prefiltered;
                ++j;
                continue;
            }

            ++stats.comparisons;
            bool same = judge_.equivalent(clusters[i].representative, clusters[j].representative);
            if (hook && stats.comparisons % options_.checkpoint_every == 0) {
                hook(clusters, stats);
            }
            if (!same) {
                ++j;
                continue;
            }

            Cluster& target = clusters[i];
            Cluster& absorbed = clusters[j];
            LOG_DEBUG("Merging ", absorbed.id, " ('", absorbed.representative, "') into ",
                      target.id, " ('", target.representative, "')");
            for (auto& member : absorbed.member_ids) {
                auto it = record_index.find(member);
                if (it != record_index.end()) records[it->second].cluster_id = target.id;
                target.member_ids.push_back(std::move(member));
            }
            clusters.erase(clusters.begin() + static_cast<std::ptrdiff_t>(j));
            keys.erase(keys.begin() + static_cast<std::ptrdiff_t>(j));
            ++stats.merges;
            // j now names the next survivor
        }
    }

    std::sort(clusters.begin(), clusters.end(),
              [](const Cluster& a, const Cluster& b) { return a.id < b.id; });

    LOG_INFO("Merge pass: ", stats.comparisons, " comparisons, ", stats.prefiltered,
             " prefiltered, ", stats.merges, " merges, ", clusters.size(), " clusters remain");
    return stats;
}

std::vector<Cluster> ClusteringEngine::cluster(std::vector<DreamRecord>& records, const ProgressHook& hook) {
    std::vector<Cluster> clusters = exact_pass(records);
    merge_pass(clusters, records, hook);
    return clusters;
}

size_t ClusteringEngine::assign_new(std::vector<Cluster>& clusters, std::vector<DreamRecord>& records) const {
    std::unordered_map<std::string, size_t> position;
    std::unordered_map<std::string, size_t> by_phrase;
    size_t last_ordinal = 0;
    for (size_t i = 0; i < clusters.size(); ++i) {
        position.emplace(clusters[i].id, i);
        by_phrase.emplace(clusters[i].representative, i);
        last_ordinal = std::max(last_ordinal, parse_cluster_ordinal(clusters[i].id));
    }
    for (const auto& record : records) {
        if (!record.assigned()) continue;
        auto it = position.find(record.cluster_id);
        if (it != position.end()) by_phrase.emplace(record.normalized_phrase, it->second);
    }

    size_t opened = 0;
    size_t joined = 0;
    for (auto& record : records) {
        if (record.assigned()) continue;
        DREAMGROUP_CHECK(record.normalized(), ErrorCode::INTERNAL_ERROR,
                         "Record " + record.id + " reached clustering without a normalized phrase");

        auto [it, inserted] = by_phrase.emplace(record.normalized_phrase, clusters.size());
        if (inserted) {
            Cluster cluster;
            cluster.id = format_cluster_id(++last_ordinal);
            cluster.representative = record.normalized_phrase;
            clusters.push_back(std::move(cluster));
            ++opened;
        } else {
            ++joined;
        }
        Cluster& cluster = clusters[it->second];
        cluster.member_ids.push_back(record.id);
        record.cluster_id = cluster.id;
    }

    LOG_INFO("Exact pass over new records: ", joined, " joined existing clusters, ", opened, " new clusters");
    return opened;
}

std::string ClusteringEngine::prefilter_key(std::string_view phrase, size_t prefix_chars, bool content_word) {
    if (prefix_chars == 0) return "";
    auto words = util::split_words(phrase);
    size_t first = (content_word && !words.empty() && words[0] == "to") ? 1 : 0;
    if (first >= words.size()) return "";

    auto codepoints = util::decode_utf8(words[first]);
    std::string key;
    for (size_t i = 0; i < codepoints.size() && i < prefix_chars; ++i) {
        key += util::encode_utf8(codepoints[i]);
    }
    return key;
}

} // namespace dreamgroup::pipeline
