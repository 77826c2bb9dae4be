#pragma once

#include "dreamgroup/config.hpp"
#include "dreamgroup/oracle/embedder.hpp"
#include "dreamgroup/pipeline/checkpoint.hpp"

#include <string>
#include <vector>

namespace dreamgroup::search {

struct IndexBuildStats {
    size_t phrases = 0;
    size_t dimensions = 0;
    std::string index_path;
    std::string meta_path;
};

// Sorted distinct normalized phrases of the state's records
std::vector<std::string> distinct_phrases(const pipeline::PipelineState& state);

// Embed every distinct phrase, unit-normalize, and write the hnswlib index plus its metadata
// into config.index_dir. Throws InvalidArgumentError when there is nothing to index.
IndexBuildStats build_index(const pipeline::PipelineState& state, oracle::Embedder& embedder,
                            const SearchConfig& config);

} // namespace dreamgroup::search
