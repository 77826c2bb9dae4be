#pragma once

#include "dreamgroup/config.hpp"
#include "dreamgroup/pipeline/equivalence.hpp"
#include "dreamgroup/types.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dreamgroup::pipeline {

struct ClusteringOptions {
    size_t window = 20;            // clusters examined after each cluster in the merge pass
    size_t prefix_chars = 3;       // prefilter on the first word's leading characters; 0 disables it
    bool content_word = false;     // prefilter on the word after a leading "to" instead
    size_t checkpoint_every = 200; // equivalence checks between progress callbacks

    static ClusteringOptions from_config(const ClusteringConfig& config);
};

struct MergeStats {
    size_t comparisons = 0;        // pairs handed to the judge
    size_t prefiltered = 0;        // pairs skipped by the prefix check
    size_t merges = 0;
};

/**
 * Partitions normalized records into clusters.
 *
 * Exact pass: one cluster per distinct normalized phrase, ids in corpus order of first appearance.
 * Merge pass: clusters sorted by representative; each one is compared with at most `window`
 * following survivors and absorbs the ones the judge calls equivalent. Clusters only ever grow,
 * so running the pass again over clusters from an earlier run keeps every earlier merge.
 * Merging is not transitively complete; pairs that never share a window stay apart.
 */
class ClusteringEngine {
public:
    // Called every options.checkpoint_every comparisons with the clusters as they stand
    using ProgressHook = std::function<void(const std::vector<Cluster>&, const MergeStats&)>;

    ClusteringEngine(EquivalenceJudge& judge, ClusteringOptions options);

    // Requires every record to be normalized; sets record.cluster_id
    std::vector<Cluster> exact_pass(std::vector<DreamRecord>& records) const;

    // Merges in place, repointing absorbed members; returns clusters ordered by id
    MergeStats merge_pass(std::vector<Cluster>& clusters, std::vector<DreamRecord>& records,
                          const ProgressHook& hook = {});

    std::vector<Cluster> cluster(std::vector<DreamRecord>& records, const ProgressHook& hook = {});

    // Exact pass for records outside every cluster: a record joins the cluster already holding its
    // phrase, otherwise it opens a new cluster numbered after the highest existing id.
    // Returns the number of clusters opened.
    size_t assign_new(std::vector<Cluster>& clusters, std::vector<DreamRecord>& records) const;

    // First prefix_chars code points of the first word, or of the word after a leading "to"
    static std::string prefilter_key(std::string_view phrase, size_t prefix_chars, bool content_word = false);

    const ClusteringOptions& options() const { return options_; }

private:
    EquivalenceJudge& judge_;
    ClusteringOptions options_;
};

} // namespace dreamgroup::pipeline
