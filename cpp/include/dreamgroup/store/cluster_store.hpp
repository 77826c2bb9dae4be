#pragma once

#include "dreamgroup/pipeline/checkpoint.hpp"
#include "dreamgroup/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace dreamgroup::store {

/**
 * Live view of the clustered corpus: clusters by id and by member phrase.
 *
 * This is the state similarity search resolves against on every query, and the place manual
 * merge decisions are applied. Lookups reflect merges immediately.
 */
class ClusterStore {
public:
    explicit ClusterStore(pipeline::PipelineState state);

    // Empty store when no checkpoint exists
    static ClusterStore load(const pipeline::CheckpointManager& checkpoint);

    const Cluster* find(const std::string& cluster_id) const;

    // Cluster holding a record whose normalized phrase equals `phrase`; nullptr if none
    const Cluster* find_by_phrase(const std::string& phrase) const;

    bool live(const std::string& cluster_id) const { return find(cluster_id) != nullptr; }

    size_t size() const { return state_.clusters.size(); }
    bool empty() const { return state_.clusters.empty(); }
    const std::vector<Cluster>& clusters() const { return state_.clusters; }
    const pipeline::PipelineState& state() const { return state_; }

    // Distinct normalized phrases of a cluster's members, representative first
    std::vector<std::string> member_phrases(const std::string& cluster_id) const;

    /**
     * Merge the source clusters into the target: members are appended in source order, records
     * repointed, sources deleted. The target keeps its representative and taxonomy.
     * Throws InvalidArgumentError for unknown ids or when a source equals the target.
     */
    const Cluster& merge_into(const std::string& target_id, const std::vector<std::string>& source_ids);

private:
    void reindex();

    pipeline::PipelineState state_;
    std::unordered_map<std::string, size_t> by_id_;
    std::unordered_map<std::string, std::string> phrase_to_cluster_;
    std::unordered_map<std::string, size_t> record_index_;
};

} // namespace dreamgroup::store
