#pragma once

#include "dreamgroup/oracle/oracle_cache.hpp"
#include "dreamgroup/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace dreamgroup::pipeline {

// Everything needed to resume: first unfinished stage, records, clusters and oracle memo
struct PipelineState {
    Stage stage = Stage::NORMALIZE;
    std::vector<DreamRecord> records;
    std::vector<Cluster> clusters;
    std::vector<oracle::CacheEntry> cache;

    bool empty() const { return records.empty() && clusters.empty() && cache.empty(); }

    // Ids of records whose normalized phrase is already known
    std::unordered_set<std::string> normalized_ids() const;

    bool operator==(const PipelineState& other) const {
        return stage == other.stage && records == other.records && clusters == other.clusters &&
               cache == other.cache;
    }
};

/**
 * Full-state JSON checkpoint.
 *
 * save() writes the whole state to <path>.tmp, flushes, fsyncs and closes it, renames it over
 * <path> and fsyncs the directory, so the file on disk is always a complete earlier save, after a
 * system crash as well as a process crash. Any failure throws CheckpointError.
 */
class CheckpointManager {
public:
    explicit CheckpointManager(std::string path);

    void save(const PipelineState& state) const;

    // Empty state when no checkpoint exists; CheckpointError when one exists but cannot be read
    PipelineState load() const;

    bool exists() const;
    void remove() const;

    const std::string& path() const { return path_; }

    static std::string to_json(const PipelineState& state);
    static PipelineState from_json(const std::string& text);

private:
    std::string path_;
};

} // namespace dreamgroup::pipeline
