#include "dreamgroup/types.hpp"
#include "dreamgroup/error.hpp"

#include <cstdio>

namespace dreamgroup {

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::NORMALIZE: return "normalize";
        case Stage::CLUSTER: return "cluster";
        case Stage::CLASSIFY: return "classify";
        case Stage::DONE: return "done";
    }
    return "unknown";
}

Stage parse_stage(const std::string& name) {
    if (name == "normalize") return Stage::NORMALIZE;
    if (name == "cluster") return Stage::CLUSTER;
    if (name == "classify") return Stage::CLASSIFY;
    if (name == "done") return Stage::DONE;
    throw InvalidArgumentError("Unknown stage '" + name + "'", __func__);
}

std::string format_cluster_id(size_t ordinal) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "group_%05zu", ordinal);
    return buf;
}

size_t parse_cluster_ordinal(const std::string& cluster_id) {
    static const std::string kPrefix = "group_";
    if (cluster_id.size() <= kPrefix.size() || cluster_id.compare(0, kPrefix.size(), kPrefix) != 0) return 0;
    size_t ordinal = 0;
    for (size_t i = kPrefix.size(); i < cluster_id.size(); ++i) {
        char c = cluster_id[i];
        if (c < '0' || c > '9') return 0;
        ordinal = ordinal * 10 + static_cast<size_t>(c - '0');
    }
    return ordinal;
}

} // namespace dreamgroup
