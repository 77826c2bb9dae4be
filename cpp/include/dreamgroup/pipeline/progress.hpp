#pragma once

#include "dreamgroup/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace dreamgroup::pipeline {

// Immutable status record; a new one is published for every change
struct ProgressSnapshot {
    Stage stage = Stage::NORMALIZE;
    size_t processed = 0;
    size_t total = 0;
    bool running = false;
    std::string last_error;
    std::chrono::system_clock::time_point updated_at{};

    double percent() const { return total == 0 ? 0.0 : 100.0 * static_cast<double>(processed) / total; }
};

/**
 * Single-writer, many-reader progress channel.
 *
 * The writer (the pipeline, possibly on a background thread) publishes whole snapshots;
 * readers get a shared_ptr to an immutable snapshot and never see a half-updated record.
 * When a status file is configured every publish is mirrored there as JSON.
 */
class ProgressTracker {
public:
    explicit ProgressTracker(std::string status_file = "");

    std::shared_ptr<const ProgressSnapshot> snapshot() const;

    void publish(ProgressSnapshot snapshot);

    // Copy-modify-publish helpers for the writer
    void update(Stage stage, size_t processed, size_t total);
    void set_running(bool running);
    void set_error(const std::string& message);

    const std::string& status_file() const { return status_file_; }

    static std::string to_json(const ProgressSnapshot& snapshot);
    static ProgressSnapshot from_json(const std::string& text);

    // Read a mirrored status file; nullopt when it does not exist
    static std::optional<ProgressSnapshot> read_status_file(const std::string& path);

private:
    void mirror(const ProgressSnapshot& snapshot) const;

    std::shared_ptr<const ProgressSnapshot> current_;
    std::string status_file_;
};

} // namespace dreamgroup::pipeline
