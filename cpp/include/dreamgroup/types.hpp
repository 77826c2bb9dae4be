#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dreamgroup {

// One dream as loaded from the corpus. Only the two derived fields change after load.
struct DreamRecord {
    std::string id;
    std::string raw_title;
    std::string author;
    std::optional<std::string> birth_date;  // YYYY-MM-DD or YYYY
    std::optional<int> age;                 // derived from birth_date against the reference year

    std::string normalized_phrase;          // empty until normalized
    std::string cluster_id;                 // empty until assigned

    bool normalized() const { return !normalized_phrase.empty(); }
    bool assigned() const { return !cluster_id.empty(); }

    bool operator==(const DreamRecord& other) const {
        return id == other.id && raw_title == other.raw_title && author == other.author &&
               birth_date == other.birth_date && age == other.age &&
               normalized_phrase == other.normalized_phrase && cluster_id == other.cluster_id;
    }
};

struct TaxonomyPath {
    std::string level1;
    std::string level2;
    std::string level3;

    bool complete() const { return !level1.empty() && !level2.empty() && !level3.empty(); }

    bool operator==(const TaxonomyPath& other) const {
        return level1 == other.level1 && level2 == other.level2 && level3 == other.level3;
    }
    bool operator!=(const TaxonomyPath& other) const { return !(*this == other); }
};

struct Cluster {
    std::string id;
    std::string representative;
    std::vector<std::string> member_ids;    // insertion order: exact pass, then merges
    std::optional<TaxonomyPath> taxonomy;

    size_t size() const { return member_ids.size(); }

    bool operator==(const Cluster& other) const {
        return id == other.id && representative == other.representative &&
               member_ids == other.member_ids && taxonomy == other.taxonomy;
    }
};

// Pipeline stages in execution order; a checkpoint records the first stage not yet finished
enum class Stage {
    NORMALIZE = 0,
    CLUSTER = 1,
    CLASSIFY = 2,
    DONE = 3
};

const char* stage_name(Stage stage);
Stage parse_stage(const std::string& name);

// Cluster ids look like group_00042
std::string format_cluster_id(size_t ordinal);

// Ordinal of a group_NNNNN id; 0 for ids of any other shape
size_t parse_cluster_ordinal(const std::string& cluster_id);

} // namespace dreamgroup
