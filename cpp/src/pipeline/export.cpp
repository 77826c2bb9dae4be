#include "dreamgroup/pipeline/export.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <unordered_map>

namespace fs = std::filesystem;

namespace dreamgroup::pipeline {

namespace {

std::string tsv_field(const std::string& value) {
    std::string out = value;
    std::replace_if(out.begin(), out.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return out;
}

template<typename WriteRows>
void write_table(const fs::path& path, WriteRows&& write_rows) {
    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Cannot open " + tmp.string());
        write_rows(out);
        out.flush();
        if (!out) DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Failed writing " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Cannot rename " + tmp.string() + ": " + ec.message());
}

const char* age_group(const std::optional<int>& age) {
    if (!age) return "unknown";
    if (*age >= 13 && *age <= 18) return "13-18";
    if (*age >= 19 && *age <= 30) return "19-30";
    return "other";
}

} // namespace

ExportPaths export_tables(const PipelineState& state, const std::string& output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        DREAMGROUP_THROW(ErrorCode::EXPORT_FAILED, "Cannot create " + output_dir + ": " + ec.message());
    }

    ExportPaths paths;
    paths.mappings = (fs::path(output_dir) / "dream_mappings.tsv").string();
    paths.groups = (fs::path(output_dir) / "dream_groups.tsv").string();

    write_table(paths.mappings, [&](std::ostream& out) {
        out << "post_id\toriginal_title\tnormalized\tgroup_id\n";
        for (const auto& r : state.records) {
            out << tsv_field(r.id) << '\t' << tsv_field(r.raw_title) << '\t'
                << tsv_field(r.normalized_phrase) << '\t' << tsv_field(r.cluster_id) << '\n';
        }
    });

    write_table(paths.groups, [&](std::ostream& out) {
        out << "group_id\trepresentative\tmember_count\tlevel1\tlevel2\tlevel3\n";
        for (const auto& c : state.clusters) {
            TaxonomyPath path = c.taxonomy.value_or(TaxonomyPath{});
            out << tsv_field(c.id) << '\t' << tsv_field(c.representative) << '\t' << c.size() << '\t'
                << tsv_field(path.level1) << '\t' << tsv_field(path.level2) << '\t'
                << tsv_field(path.level3) << '\n';
        }
    });

    LOG_INFO("Exported ", state.records.size(), " mappings and ", state.clusters.size(),
             " groups to ", output_dir);
    return paths;
}

SummaryReport build_summary(const PipelineState& state, size_t top_n) {
    SummaryReport report;
    report.records = state.records.size();
    report.clusters = state.clusters.size();

    size_t assigned = 0;
    std::map<std::string, size_t> categories;
    for (const auto& c : state.clusters) {
        assigned += c.size();
        if (c.size() == 1) ++report.singletons;
        categories[c.taxonomy ? c.taxonomy->level1 : "Unclassified"] += c.size();
    }
    report.average_size = report.clusters ? static_cast<double>(assigned) / report.clusters : 0.0;

    std::vector<const Cluster*> ranked;
    ranked.reserve(state.clusters.size());
    for (const auto& c : state.clusters) ranked.push_back(&c);
    std::sort(ranked.begin(), ranked.end(), [](const Cluster* a, const Cluster* b) {
        if (a->size() != b->size()) return a->size() > b->size();
        return a->id < b->id;
    });
    for (size_t i = 0; i < ranked.size() && i < top_n; ++i) {
        report.top.push_back({ranked[i]->id, ranked[i]->representative, ranked[i]->size(),
                              ranked[i]->taxonomy.value_or(TaxonomyPath{})});
    }

    report.categories.assign(categories.begin(), categories.end());
    std::stable_sort(report.categories.begin(), report.categories.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::map<std::string, size_t> ages{{"13-18", 0}, {"19-30", 0}, {"other", 0}, {"unknown", 0}};
    for (const auto& r : state.records) ++ages[age_group(r.age)];
    for (const char* group : {"13-18", "19-30", "other", "unknown"}) {
        report.age_groups.emplace_back(group, ages[group]);
    }
    return report;
}

void print_summary(std::ostream& out, const SummaryReport& report) {
    out << "Records:          " << report.records << "\n"
        << "Clusters:         " << report.clusters << "\n"
        << "Singletons:       " << report.singletons << "\n"
        << "Avg cluster size: " << std::fixed << std::setprecision(2) << report.average_size << "\n\n";

    out << "Top clusters:\n";
    for (size_t i = 0; i < report.top.size(); ++i) {
        const auto& c = report.top[i];
        out << std::setw(3) << i + 1 << ". " << c.representative << " (" << c.members << " dreams, "
            << c.id << ")";
        if (c.taxonomy.complete()) {
            out << " [" << c.taxonomy.level1 << " > " << c.taxonomy.level2 << " > " << c.taxonomy.level3 << "]";
        }
        out << "\n";
    }

    out << "\nCategories:\n";
    for (const auto& [name, count] : report.categories) {
        double pct = report.records ? 100.0 * static_cast<double>(count) / report.records : 0.0;
        out << "  " << std::left << std::setw(20) << name << std::right << std::setw(8) << count
            << "  " << std::setprecision(1) << pct << "%\n";
    }

    out << "\nAge groups:\n";
    for (const auto& [name, count] : report.age_groups) {
        out << "  " << std::left << std::setw(20) << name << std::right << std::setw(8) << count << "\n";
    }
}

} // namespace dreamgroup::pipeline
