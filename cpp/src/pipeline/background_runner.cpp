#include "dreamgroup/pipeline/background_runner.hpp"
#include "dreamgroup/logging.hpp"

namespace dreamgroup::pipeline {

RunOutcome run_tracked(ProgressTracker& tracker, const std::function<RunOutcome()>& job) {
    tracker.set_running(true);
    try {
        RunOutcome outcome = job();
        tracker.set_running(false);
        return outcome;
    } catch (const std::exception& e) {
        LOG_ERROR("Pipeline failed: ", e.what());
        tracker.set_error(e.what());
        tracker.set_running(false);
        throw;
    }
}

BackgroundRunner::BackgroundRunner(ProgressTracker& tracker) : tracker_(tracker) {}

BackgroundRunner::~BackgroundRunner() {
    wait();
}

bool BackgroundRunner::start(Job job) {
    if (running_.exchange(true)) {
        LOG_WARN("Pipeline already running; start request ignored");
        return false;
    }
    if (worker_.joinable()) worker_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_.reset();
        error_.clear();
    }
    tracker_.set_running(true);

    worker_ = std::thread([this, job = std::move(job)]() {
        try {
            RunOutcome result = run_tracked(tracker_, job);
            std::lock_guard<std::mutex> lock(mutex_);
            outcome_ = result;
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            error_ = e.what();
        }
        running_.store(false);
    });
    return true;
}

void BackgroundRunner::wait() {
    if (worker_.joinable()) worker_.join();
}

std::optional<RunOutcome> BackgroundRunner::outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

std::string BackgroundRunner::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

} // namespace dreamgroup::pipeline
