#include "dreamgroup/pipeline/progress.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"

#include <boost/json.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace dreamgroup::pipeline {

ProgressTracker::ProgressTracker(std::string status_file)
    : current_(std::make_shared<const ProgressSnapshot>())
    , status_file_(std::move(status_file)) {}

std::shared_ptr<const ProgressSnapshot> ProgressTracker::snapshot() const {
    return std::atomic_load(&current_);
}

void ProgressTracker::publish(ProgressSnapshot snapshot) {
    snapshot.updated_at = std::chrono::system_clock::now();
    auto next = std::make_shared<const ProgressSnapshot>(std::move(snapshot));
    std::atomic_store(&current_, next);
    if (!status_file_.empty()) mirror(*next);
}

void ProgressTracker::update(Stage stage, size_t processed, size_t total) {
    ProgressSnapshot next = *snapshot();
    next.stage = stage;
    next.processed = processed;
    next.total = total;
    publish(std::move(next));
}

void ProgressTracker::set_running(bool running) {
    ProgressSnapshot next = *snapshot();
    next.running = running;
    if (running) next.last_error.clear();
    publish(std::move(next));
}

void ProgressTracker::set_error(const std::string& message) {
    ProgressSnapshot next = *snapshot();
    next.last_error = message;
    publish(std::move(next));
}

std::string ProgressTracker::to_json(const ProgressSnapshot& snapshot) {
    boost::json::object obj;
    obj["stage"] = stage_name(snapshot.stage);
    obj["processed"] = snapshot.processed;
    obj["total"] = snapshot.total;
    obj["running"] = snapshot.running;
    obj["last_error"] = snapshot.last_error;
    obj["updated_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        snapshot.updated_at.time_since_epoch()).count();
    return boost::json::serialize(obj);
}

ProgressSnapshot ProgressTracker::from_json(const std::string& text) {
    try {
        boost::json::value doc = boost::json::parse(text);
        const auto& obj = doc.as_object();
        ProgressSnapshot snapshot;
        snapshot.stage = parse_stage(obj.at("stage").as_string().c_str());
        snapshot.processed = obj.at("processed").to_number<size_t>();
        snapshot.total = obj.at("total").to_number<size_t>();
        snapshot.running = obj.at("running").as_bool();
        snapshot.last_error = obj.at("last_error").as_string().c_str();
        snapshot.updated_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(obj.at("updated_at").to_number<int64_t>()));
        return snapshot;
    } catch (const std::exception& e) {
        throw DreamGroupException(ErrorCode::INVALID_ARGUMENT,
                                  "Malformed status record: " + std::string(e.what()), __func__);
    }
}

std::optional<ProgressSnapshot> ProgressTracker::read_status_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

void ProgressTracker::mirror(const ProgressSnapshot& snapshot) const {
    // Status mirroring is best effort; a failure must not stop the pipeline
    const std::string tmp = status_file_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << to_json(snapshot);
        if (!out) {
            LOG_WARN("Cannot write status file ", tmp);
            return;
        }
    }
    std::error_code ec;
    fs::rename(tmp, status_file_, ec);
    if (ec) {
        LOG_WARN("Cannot update status file ", status_file_, ": ", ec.message());
    }
}

} // namespace dreamgroup::pipeline
