#include "dreamgroup/pipeline/pipeline.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/pipeline/corpus.hpp"
#include "dreamgroup/util/text.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace dreamgroup::pipeline {

Pipeline::Pipeline(const Config& config, oracle::TextOracle& oracle, ProgressTracker* tracker)
    : settings_(config.pipeline)
    , clustering_(ClusteringOptions::from_config(config.clustering))
    , checkpoint_(config.pipeline.checkpoint_file)
    , cache_(0)
    , normalizer_(oracle, cache_)
    , judge_(oracle, cache_)
    , classifier_(oracle, cache_)
    , tracker_(tracker) {
    if (settings_.checkpoint_every == 0) settings_.checkpoint_every = 1;
}

RunOutcome Pipeline::run() {
    CorpusLoadResult loaded = load_corpus(settings_.corpus_file, settings_.reference_year);
    return run(std::move(loaded.records));
}

RunOutcome Pipeline::run(std::vector<DreamRecord> corpus) {
    RunOutcome outcome;
    reconcile(std::move(corpus));

    LOG_INFO("Pipeline starting at stage ", stage_name(state_.stage), " with ",
             state_.records.size(), " records");

    if (state_.stage == Stage::NORMALIZE) {
        if (!normalize_stage(outcome)) {
            outcome.stage = state_.stage;
            outcome.oracle_calls = normalizer_.oracle_calls();
            return outcome;
        }
    }
    if (state_.stage == Stage::CLUSTER) cluster_stage(outcome);
    if (state_.stage == Stage::CLASSIFY) classify_stage(outcome);

    outcome.stage = state_.stage;
    outcome.completed = state_.stage == Stage::DONE;
    outcome.oracle_calls = normalizer_.oracle_calls() + judge_.oracle_calls() + classifier_.oracle_calls();
    report(state_.stage, state_.records.size(), state_.records.size());

    LOG_INFO("Pipeline finished: ", outcome.normalized, " normalized, ", outcome.merges, " merges, ",
             outcome.classified, " classified, ", outcome.oracle_calls, " oracle calls, ",
             state_.clusters.size(), " clusters");
    return outcome;
}

void Pipeline::reconcile(std::vector<DreamRecord> corpus) {
    PipelineState saved = checkpoint_.load();
    cache_.restore(saved.cache);

    std::unordered_map<std::string, const DreamRecord*> saved_by_id;
    for (const auto& r : saved.records) saved_by_id.emplace(r.id, &r);

    state_ = PipelineState{};
    state_.stage = saved.stage;
    state_.records.reserve(corpus.size());

    bool new_work = false;
    size_t matched = 0;
    for (auto& record : corpus) {
        if (util::trim(record.raw_title).empty()) {
            LOG_WARN("Skipping record ", record.id, " with blank title");
            continue;
        }
        auto it = saved_by_id.find(record.id);
        if (it != saved_by_id.end()) {
            record.normalized_phrase = it->second->normalized_phrase;
            record.cluster_id = it->second->cluster_id;
            ++matched;
        }
        if (!record.normalized()) new_work = true;
        state_.records.push_back(std::move(record));
    }

    // Clusters from earlier runs are carried over so merges, manual ones included, are never undone.
    // Members that left the corpus are dropped, and so are clusters left without members.
    std::unordered_set<std::string> present;
    for (const auto& record : state_.records) present.insert(record.id);

    std::unordered_map<std::string, std::string> owner;
    size_t pruned = 0;
    for (auto& cluster : saved.clusters) {
        auto& members = cluster.member_ids;
        const size_t before = members.size();
        members.erase(std::remove_if(members.begin(), members.end(),
                                     [&](const std::string& id) { return present.count(id) == 0; }),
                      members.end());
        pruned += before - members.size();
        if (members.empty()) continue;
        for (const auto& id : members) owner.emplace(id, cluster.id);
        state_.clusters.push_back(std::move(cluster));
    }
    if (pruned > 0) {
        LOG_INFO("Dropped ", pruned, " cluster members no longer in the corpus");
    }

    // cluster_id always agrees with membership
    size_t unassigned = 0;
    for (auto& record : state_.records) {
        auto it = owner.find(record.id);
        record.cluster_id = it != owner.end() ? it->second : std::string();
        if (!record.assigned()) ++unassigned;
    }

    if (new_work && state_.stage != Stage::NORMALIZE) {
        LOG_INFO("Corpus has records the checkpoint never normalized; restarting at normalize");
        state_.stage = Stage::NORMALIZE;
    } else if (unassigned > 0 && state_.stage > Stage::CLUSTER) {
        LOG_INFO(unassigned, " records are outside every cluster; clustering again");
        state_.stage = Stage::CLUSTER;
    }
    LOG_DEBUG("Reconciled ", matched, " checkpointed records, ", state_.clusters.size(), " clusters carried over");
}

bool Pipeline::normalize_stage(RunOutcome& outcome) {
    const size_t total = state_.records.size();
    size_t done = static_cast<size_t>(std::count_if(state_.records.begin(), state_.records.end(),
                                                    [](const DreamRecord& r) { return r.normalized(); }));
    report(Stage::NORMALIZE, done, total);
    LOG_INFO("Normalizing ", total - done, " of ", total, " records");

    size_t since_checkpoint = 0;
    for (auto& record : state_.records) {
        if (record.normalized()) continue;

        if (settings_.max_records_per_run > 0 && outcome.normalized >= settings_.max_records_per_run) {
            save(outcome);
            LOG_INFO("Batch limit of ", settings_.max_records_per_run, " reached at ", done, "/", total,
                     "; rerun to continue");
            return false;
        }

        record.normalized_phrase = normalizer_.normalize(record.raw_title);
        ++outcome.normalized;
        ++done;
        report(Stage::NORMALIZE, done, total);

        if (++since_checkpoint >= settings_.checkpoint_every) {
            save(outcome);
            since_checkpoint = 0;
            LOG_INFO("Normalized ", done, "/", total);
        }
    }

    state_.stage = Stage::CLUSTER;
    save(outcome);
    return true;
}

void Pipeline::cluster_stage(RunOutcome& outcome) {
    ClusteringEngine engine(judge_, clustering_);

    if (state_.clusters.empty()) {
        state_.clusters = engine.exact_pass(state_.records);
    } else {
        engine.assign_new(state_.clusters, state_.records);
    }
    report(Stage::CLUSTER, 0, state_.clusters.size());

    // merge_pass works on state_.clusters in place, so a save here captures the pass as it stands
    auto hook = [this, &outcome](const std::vector<Cluster>&, const MergeStats& stats) {
        save(outcome);
        report(Stage::CLUSTER, stats.comparisons, 0);
    };
    MergeStats stats = engine.merge_pass(state_.clusters, state_.records, hook);

    outcome.comparisons += stats.comparisons;
    outcome.merges += stats.merges;
    state_.stage = Stage::CLASSIFY;
    save(outcome);
}

void Pipeline::classify_stage(RunOutcome& outcome) {
    const size_t total = state_.clusters.size();
    size_t done = static_cast<size_t>(std::count_if(state_.clusters.begin(), state_.clusters.end(),
                                                    [](const Cluster& c) { return c.taxonomy.has_value(); }));
    report(Stage::CLASSIFY, done, total);
    LOG_INFO("Classifying ", total - done, " of ", total, " clusters");

    size_t since_checkpoint = 0;
    for (auto& cluster : state_.clusters) {
        if (cluster.taxonomy) continue;

        cluster.taxonomy = classifier_.classify(cluster.representative);
        ++outcome.classified;
        ++done;
        report(Stage::CLASSIFY, done, total);

        if (++since_checkpoint >= settings_.checkpoint_every) {
            save(outcome);
            since_checkpoint = 0;
        }
    }

    state_.stage = Stage::DONE;
    save(outcome);
}

void Pipeline::save(RunOutcome& outcome) {
    state_.cache = cache_.entries();
    checkpoint_.save(state_);
    ++outcome.checkpoints;
}

void Pipeline::report(Stage stage, size_t processed, size_t total) {
    if (tracker_) tracker_->update(stage, processed, total);
}

} // namespace dreamgroup::pipeline
