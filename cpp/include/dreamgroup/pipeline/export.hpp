#pragma once

#include "dreamgroup/pipeline/checkpoint.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace dreamgroup::pipeline {

struct ExportPaths {
    std::string mappings;   // dream_mappings.tsv
    std::string groups;     // dream_groups.tsv
};

// Write the assignment and cluster tables under output_dir (created if needed).
// Throws DreamGroupException(EXPORT_FAILED) on I/O errors.
ExportPaths export_tables(const PipelineState& state, const std::string& output_dir);

struct SummaryReport {
    struct TopCluster {
        std::string id;
        std::string representative;
        size_t members = 0;
        TaxonomyPath taxonomy;
    };

    size_t records = 0;
    size_t clusters = 0;
    size_t singletons = 0;
    double average_size = 0.0;
    std::vector<TopCluster> top;
    std::vector<std::pair<std::string, size_t>> categories;  // level1 -> members, largest first
    std::vector<std::pair<std::string, size_t>> age_groups;  // 13-18, 19-30, other, unknown
};

SummaryReport build_summary(const PipelineState& state, size_t top_n = 10);
void print_summary(std::ostream& out, const SummaryReport& report);

} // namespace dreamgroup::pipeline
