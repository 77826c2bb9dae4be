#include "dreamgroup/pipeline/checkpoint.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/util/file_sync.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace dreamgroup::pipeline {

namespace {

constexpr int kFormatVersion = 1;

std::string get_string(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return "";
    return std::string(v->as_string().c_str());
}

json::value record_to_json(const DreamRecord& r) {
    json::object obj;
    obj["id"] = r.id;
    obj["raw_title"] = r.raw_title;
    obj["author"] = r.author;
    if (r.birth_date) obj["birth_date"] = *r.birth_date;
    if (r.age) obj["age"] = *r.age;
    if (r.normalized()) obj["normalized"] = r.normalized_phrase;
    if (r.assigned()) obj["cluster_id"] = r.cluster_id;
    return obj;
}

DreamRecord record_from_json(const json::object& obj) {
    DreamRecord r;
    r.id = get_string(obj, "id");
    r.raw_title = get_string(obj, "raw_title");
    r.author = get_string(obj, "author");
    if (const auto* v = obj.if_contains("birth_date")) r.birth_date = std::string(v->as_string().c_str());
    if (const auto* v = obj.if_contains("age")) r.age = static_cast<int>(v->as_int64());
    r.normalized_phrase = get_string(obj, "normalized");
    r.cluster_id = get_string(obj, "cluster_id");
    return r;
}

json::value cluster_to_json(const Cluster& c) {
    json::object obj;
    obj["id"] = c.id;
    obj["representative"] = c.representative;
    json::array members;
    for (const auto& id : c.member_ids) members.push_back(json::string(id));
    obj["members"] = std::move(members);
    if (c.taxonomy) {
        json::array path;
        path.push_back(json::string(c.taxonomy->level1));
        path.push_back(json::string(c.taxonomy->level2));
        path.push_back(json::string(c.taxonomy->level3));
        obj["taxonomy"] = std::move(path);
    }
    return obj;
}

Cluster cluster_from_json(const json::object& obj) {
    Cluster c;
    c.id = get_string(obj, "id");
    c.representative = get_string(obj, "representative");
    for (const auto& m : obj.at("members").as_array()) {
        c.member_ids.emplace_back(m.as_string().c_str());
    }
    if (const auto* v = obj.if_contains("taxonomy")) {
        const auto& path = v->as_array();
        if (path.size() != 3) {
            throw CheckpointError("Cluster " + c.id + " has a malformed taxonomy", __func__,
                                  ErrorCode::CHECKPOINT_READ_FAILED);
        }
        c.taxonomy = TaxonomyPath{path[0].as_string().c_str(), path[1].as_string().c_str(),
                                  path[2].as_string().c_str()};
    }
    return c;
}

} // namespace

std::unordered_set<std::string> PipelineState::normalized_ids() const {
    std::unordered_set<std::string> ids;
    for (const auto& r : records) {
        if (r.normalized()) ids.insert(r.id);
    }
    return ids;
}

CheckpointManager::CheckpointManager(std::string path) : path_(std::move(path)) {
    DREAMGROUP_CHECK_ARGUMENT(!path_.empty(), "Checkpoint path must not be empty");
}

std::string CheckpointManager::to_json(const PipelineState& state) {
    json::object root;
    root["version"] = kFormatVersion;
    root["stage"] = stage_name(state.stage);

    json::array records;
    for (const auto& r : state.records) records.push_back(record_to_json(r));
    root["records"] = std::move(records);

    json::array clusters;
    for (const auto& c : state.clusters) clusters.push_back(cluster_to_json(c));
    root["clusters"] = std::move(clusters);

    json::array cache;
    for (const auto& e : state.cache) {
        json::object entry;
        entry["kind"] = oracle::operation_kind_name(e.kind);
        entry["key"] = e.key;
        entry["value"] = e.value;
        cache.push_back(std::move(entry));
    }
    root["cache"] = std::move(cache);

    return json::serialize(root);
}

PipelineState CheckpointManager::from_json(const std::string& text) {
    try {
        json::value doc = json::parse(text);
        const json::object& root = doc.as_object();

        PipelineState state;
        state.stage = parse_stage(get_string(root, "stage"));
        for (const auto& r : root.at("records").as_array()) {
            state.records.push_back(record_from_json(r.as_object()));
        }
        for (const auto& c : root.at("clusters").as_array()) {
            state.clusters.push_back(cluster_from_json(c.as_object()));
        }
        if (const auto* cache = root.if_contains("cache")) {
            for (const auto& e : cache->as_array()) {
                const auto& obj = e.as_object();
                state.cache.push_back(oracle::CacheEntry{
                    oracle::parse_operation_kind(get_string(obj, "kind")),
                    get_string(obj, "key"),
                    get_string(obj, "value")});
            }
        }
        return state;
    } catch (const CheckpointError&) {
        throw;
    } catch (const std::exception& e) {
        throw CheckpointError("Malformed checkpoint: " + std::string(e.what()), __func__,
                              ErrorCode::CHECKPOINT_READ_FAILED);
    }
}

void CheckpointManager::save(const PipelineState& state) const {
    const std::string tmp = path_ + ".tmp";
    const std::string body = to_json(state);

    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw CheckpointError("Cannot create directory " + parent.string() + ": " + ec.message(), __func__);
        }
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CheckpointError("Cannot open " + tmp + " for writing", __func__);
        }
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out) {
            throw CheckpointError("Failed writing " + tmp, __func__);
        }
        out.close();
        if (out.fail()) {
            throw CheckpointError("Failed closing " + tmp, __func__);
        }
    }
    if (std::error_code sync_ec = util::sync_to_disk(tmp)) {
        throw CheckpointError("Cannot sync " + tmp + ": " + sync_ec.message(), __func__);
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw CheckpointError("Cannot rename " + tmp + " to " + path_ + ": " + ec.message(), __func__);
    }
    // The rename itself is durable only once the directory entry is synced
    const std::string dir = util::parent_directory(path_);
    if (std::error_code dir_ec = util::sync_to_disk(dir)) {
        throw CheckpointError("Cannot sync directory " + dir + ": " + dir_ec.message(), __func__);
    }

    LOG_DEBUG("Checkpoint saved: stage=", stage_name(state.stage), " records=", state.records.size(),
              " clusters=", state.clusters.size(), " cache=", state.cache.size());
}

PipelineState CheckpointManager::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw CheckpointError("Cannot stat " + path_ + ": " + ec.message(), __func__,
                                  ErrorCode::CHECKPOINT_READ_FAILED);
        }
        LOG_INFO("No checkpoint at ", path_, "; starting fresh");
        return PipelineState{};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw CheckpointError("Cannot open " + path_, __func__, ErrorCode::CHECKPOINT_READ_FAILED);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw CheckpointError("Failed reading " + path_, __func__, ErrorCode::CHECKPOINT_READ_FAILED);
    }

    PipelineState state = from_json(buffer.str());
    LOG_INFO("Resuming from ", path_, ": stage=", stage_name(state.stage), ", ",
             state.normalized_ids().size(), "/", state.records.size(), " normalized, ",
             state.clusters.size(), " clusters, ", state.cache.size(), " cached oracle results");
    return state;
}

bool CheckpointManager::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

void CheckpointManager::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        throw CheckpointError("Cannot remove " + path_ + ": " + ec.message(), __func__);
    }
}

} // namespace dreamgroup::pipeline
