#pragma once

#include "dreamgroup/pipeline/pipeline.hpp"
#include "dreamgroup/pipeline/progress.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace dreamgroup::pipeline {

/**
 * Run a job on the calling thread with the same tracker bookkeeping as BackgroundRunner:
 * running is set for the duration, a failure is recorded in last_error and rethrown.
 */
RunOutcome run_tracked(ProgressTracker& tracker, const std::function<RunOutcome()>& job);

/**
 * Runs one pipeline job at a time on a worker thread.
 *
 * The job is the only writer of the tracker while it runs; callers poll tracker.snapshot().
 * Exceptions thrown by the job are recorded in the tracker's last_error and in error().
 */
class BackgroundRunner {
public:
    using Job = std::function<RunOutcome()>;

    explicit BackgroundRunner(ProgressTracker& tracker);
    ~BackgroundRunner();

    BackgroundRunner(const BackgroundRunner&) = delete;
    BackgroundRunner& operator=(const BackgroundRunner&) = delete;

    // False when a job is already running
    bool start(Job job);

    bool running() const { return running_.load(); }

    // Block until the current job (if any) has finished
    void wait();

    std::optional<RunOutcome> outcome() const;
    std::string error() const;

private:
    ProgressTracker& tracker_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
    std::optional<RunOutcome> outcome_;
    std::string error_;
};

} // namespace dreamgroup::pipeline
