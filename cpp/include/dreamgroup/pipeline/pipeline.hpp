#pragma once

#include "dreamgroup/config.hpp"
#include "dreamgroup/oracle/oracle_cache.hpp"
#include "dreamgroup/oracle/text_oracle.hpp"
#include "dreamgroup/pipeline/checkpoint.hpp"
#include "dreamgroup/pipeline/clustering.hpp"
#include "dreamgroup/pipeline/equivalence.hpp"
#include "dreamgroup/pipeline/normalizer.hpp"
#include "dreamgroup/pipeline/progress.hpp"
#include "dreamgroup/pipeline/taxonomy.hpp"

#include <vector>

namespace dreamgroup::pipeline {

struct RunOutcome {
    Stage stage = Stage::NORMALIZE;  // first stage not finished when run() returned
    bool completed = false;
    size_t normalized = 0;           // records normalized during this run
    size_t classified = 0;           // clusters classified during this run
    size_t comparisons = 0;
    size_t merges = 0;
    size_t oracle_calls = 0;
    size_t checkpoints = 0;
};

/**
 * Resumable normalize -> cluster -> classify run over a corpus.
 *
 * On start the checkpoint (if any) is merged into the corpus: records it already normalized keep
 * their phrase, and the oracle cache is restored, so nothing already paid for is asked again.
 * Checkpointed clusters are kept: new records join them through an exact pass and the merge pass
 * runs again, so earlier merges (manual ones included) survive later runs.
 * Progress is checkpointed every pipeline.checkpoint_every records and every
 * clustering.checkpoint_every merge comparisons. A CheckpointError aborts the run.
 */
class Pipeline {
public:
    Pipeline(const Config& config, oracle::TextOracle& oracle, ProgressTracker* tracker = nullptr);

    // Load the corpus named in the configuration and run
    RunOutcome run();

    RunOutcome run(std::vector<DreamRecord> corpus);

    const PipelineState& state() const { return state_; }
    oracle::OracleCache& cache() { return cache_; }
    const CheckpointManager& checkpoint() const { return checkpoint_; }

private:
    void reconcile(std::vector<DreamRecord> corpus);
    bool normalize_stage(RunOutcome& outcome);
    void cluster_stage(RunOutcome& outcome);
    void classify_stage(RunOutcome& outcome);
    void save(RunOutcome& outcome);
    void report(Stage stage, size_t processed, size_t total);

    PipelineConfig settings_;
    ClusteringOptions clustering_;
    CheckpointManager checkpoint_;
    oracle::OracleCache cache_;
    Normalizer normalizer_;
    EquivalenceJudge judge_;
    TaxonomyClassifier classifier_;
    ProgressTracker* tracker_;
    PipelineState state_;
};

} // namespace dreamgroup::pipeline
