#include "dreamgroup/store/cluster_store.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace dreamgroup::store {

ClusterStore::ClusterStore(pipeline::PipelineState state) : state_(std::move(state)) {
    reindex();
}

ClusterStore ClusterStore::load(const pipeline::CheckpointManager& checkpoint) {
    pipeline::PipelineState state = checkpoint.load();
    if (state.stage < Stage::CLASSIFY) {
        LOG_WARN("Checkpoint is at stage ", stage_name(state.stage), "; clusters are not final yet");
    }
    return ClusterStore(std::move(state));
}

void ClusterStore::reindex() {
    by_id_.clear();
    phrase_to_cluster_.clear();
    record_index_.clear();

    for (size_t i = 0; i < state_.clusters.size(); ++i) {
        by_id_.emplace(state_.clusters[i].id, i);
    }
    for (size_t i = 0; i < state_.records.size(); ++i) {
        const DreamRecord& r = state_.records[i];
        record_index_.emplace(r.id, i);
        if (r.normalized() && r.assigned() && by_id_.count(r.cluster_id)) {
            phrase_to_cluster_.emplace(r.normalized_phrase, r.cluster_id);
        }
    }
    // Representatives resolve even when record rows are missing
    for (const auto& c : state_.clusters) {
        phrase_to_cluster_.emplace(c.representative, c.id);
    }
}

const Cluster* ClusterStore::find(const std::string& cluster_id) const {
    auto it = by_id_.find(cluster_id);
    return it == by_id_.end() ? nullptr : &state_.clusters[it->second];
}

const Cluster* ClusterStore::find_by_phrase(const std::string& phrase) const {
    auto it = phrase_to_cluster_.find(phrase);
    return it == phrase_to_cluster_.end() ? nullptr : find(it->second);
}

std::vector<std::string> ClusterStore::member_phrases(const std::string& cluster_id) const {
    std::vector<std::string> phrases;
    const Cluster* cluster = find(cluster_id);
    if (!cluster) return phrases;

    std::unordered_set<std::string> seen;
    phrases.push_back(cluster->representative);
    seen.insert(cluster->representative);
    for (const auto& member : cluster->member_ids) {
        auto it = record_index_.find(member);
        if (it == record_index_.end()) continue;
        const std::string& phrase = state_.records[it->second].normalized_phrase;
        if (!phrase.empty() && seen.insert(phrase).second) phrases.push_back(phrase);
    }
    return phrases;
}

const Cluster& ClusterStore::merge_into(const std::string& target_id, const std::vector<std::string>& source_ids) {
    DREAMGROUP_CHECK_ARGUMENT(!source_ids.empty(), "Nothing to merge");
    if (!live(target_id)) {
        throw InvalidArgumentError("Unknown target cluster " + target_id, __func__);
    }
    std::unordered_set<std::string> distinct;
    for (const auto& source : source_ids) {
        if (source == target_id) {
            throw InvalidArgumentError("Cannot merge " + source + " into itself", __func__);
        }
        if (!live(source)) {
            throw InvalidArgumentError("Unknown source cluster " + source, __func__,
                                       "It may already have been merged away");
        }
        if (!distinct.insert(source).second) {
            throw InvalidArgumentError("Source cluster " + source + " listed twice", __func__);
        }
    }

    Cluster& target = state_.clusters[by_id_.at(target_id)];
    for (const auto& source_id : source_ids) {
        Cluster& source = state_.clusters[by_id_.at(source_id)];
        for (auto& member : source.member_ids) {
            auto it = record_index_.find(member);
            if (it != record_index_.end()) state_.records[it->second].cluster_id = target_id;
            target.member_ids.push_back(std::move(member));
        }
        source.member_ids.clear();
        LOG_INFO("Merged ", source_id, " ('", source.representative, "') into ", target_id);
    }

    state_.clusters.erase(std::remove_if(state_.clusters.begin(), state_.clusters.end(),
                                         [&](const Cluster& c) { return distinct.count(c.id) > 0; }),
                          state_.clusters.end());
    reindex();
    return state_.clusters[by_id_.at(target_id)];
}

} // namespace dreamgroup::store
