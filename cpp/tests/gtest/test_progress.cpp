// =============================================================================
// Progress Tracking and Background Runner Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dreamgroup/error.hpp"
#include "dreamgroup/pipeline/background_runner.hpp"
#include "dreamgroup/pipeline/progress.hpp"
#include "test_support.hpp"

#include <atomic>
#include <future>
#include <thread>

using namespace dreamgroup;
using namespace dreamgroup::pipeline;

TEST(ProgressTrackerTest, StartsIdle) {
    ProgressTracker tracker;
    auto s = tracker.snapshot();
    EXPECT_FALSE(s->running);
    EXPECT_EQ(s->processed, 0u);
    EXPECT_DOUBLE_EQ(s->percent(), 0.0);
}

TEST(ProgressTrackerTest, SnapshotsAreImmutable) {
    ProgressTracker tracker;
    tracker.update(Stage::NORMALIZE, 10, 40);
    auto before = tracker.snapshot();
    tracker.update(Stage::CLUSTER, 3, 9);

    EXPECT_EQ(before->stage, Stage::NORMALIZE);
    EXPECT_EQ(before->processed, 10u);
    EXPECT_DOUBLE_EQ(before->percent(), 25.0);
    EXPECT_EQ(tracker.snapshot()->stage, Stage::CLUSTER);
}

TEST(ProgressTrackerTest, ErrorClearedOnNextStart) {
    ProgressTracker tracker;
    tracker.set_error("oracle down");
    EXPECT_EQ(tracker.snapshot()->last_error, "oracle down");
    tracker.set_running(true);
    EXPECT_TRUE(tracker.snapshot()->last_error.empty());
}

TEST(ProgressTrackerTest, MirrorsToStatusFile) {
    test::TempDir dir;
    const std::string path = dir.file("status.json");
    ProgressTracker tracker(path);
    EXPECT_FALSE(ProgressTracker::read_status_file(path).has_value());

    tracker.set_running(true);
    tracker.update(Stage::CLASSIFY, 5, 8);

    auto status = ProgressTracker::read_status_file(path);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->stage, Stage::CLASSIFY);
    EXPECT_EQ(status->processed, 5u);
    EXPECT_EQ(status->total, 8u);
    EXPECT_TRUE(status->running);
}

TEST(ProgressTrackerTest, MalformedStatusRecordThrows) {
    EXPECT_THROW(ProgressTracker::from_json("{\"stage\":1}"), DreamGroupException);
}

TEST(ProgressTrackerTest, ConcurrentReadersSeeWholeSnapshots) {
    ProgressTracker tracker;
    std::atomic<bool> stop{false};
    std::atomic<size_t> torn{0};

    std::thread reader([&]() {
        while (!stop.load()) {
            auto s = tracker.snapshot();
            // Writer always publishes processed == total
            if (s->processed != s->total) ++torn;
        }
    });
    for (size_t i = 0; i < 2000; ++i) tracker.update(Stage::NORMALIZE, i, i);
    stop.store(true);
    reader.join();

    EXPECT_EQ(torn.load(), 0u);
}

// -----------------------------------------------------------------------------
// BackgroundRunner
// -----------------------------------------------------------------------------

TEST(BackgroundRunnerTest, RunsJobAndReportsOutcome) {
    ProgressTracker tracker;
    BackgroundRunner runner(tracker);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    ASSERT_TRUE(runner.start([gate]() {
        gate.wait();
        RunOutcome outcome;
        outcome.stage = Stage::DONE;
        outcome.completed = true;
        outcome.normalized = 3;
        return outcome;
    }));

    EXPECT_TRUE(runner.running());
    EXPECT_TRUE(tracker.snapshot()->running);
    // A second job is refused while the first is in flight
    EXPECT_FALSE(runner.start([]() { return RunOutcome{}; }));

    release.set_value();
    runner.wait();

    EXPECT_FALSE(runner.running());
    EXPECT_FALSE(tracker.snapshot()->running);
    ASSERT_TRUE(runner.outcome().has_value());
    EXPECT_TRUE(runner.outcome()->completed);
    EXPECT_EQ(runner.outcome()->normalized, 3u);
    EXPECT_TRUE(runner.error().empty());
}

TEST(BackgroundRunnerTest, FailuresAreRecorded) {
    ProgressTracker tracker;
    BackgroundRunner runner(tracker);

    ASSERT_TRUE(runner.start([]() -> RunOutcome {
        throw CheckpointError("disk full", "save");
    }));
    runner.wait();

    EXPECT_FALSE(runner.running());
    EXPECT_FALSE(runner.outcome().has_value());
    EXPECT_NE(runner.error().find("disk full"), std::string::npos);
    EXPECT_NE(tracker.snapshot()->last_error.find("disk full"), std::string::npos);
}

TEST(BackgroundRunnerTest, CanRunAgainAfterCompletion) {
    ProgressTracker tracker;
    BackgroundRunner runner(tracker);

    ASSERT_TRUE(runner.start([]() { return RunOutcome{}; }));
    runner.wait();
    ASSERT_TRUE(runner.start([]() {
        RunOutcome outcome;
        outcome.merges = 7;
        return outcome;
    }));
    runner.wait();
    EXPECT_EQ(runner.outcome()->merges, 7u);
}

TEST(RunTrackedTest, SuccessLeavesTrackerIdle) {
    ProgressTracker tracker;
    RunOutcome outcome = run_tracked(tracker, [&tracker]() {
        EXPECT_TRUE(tracker.snapshot()->running);
        RunOutcome done;
        done.completed = true;
        return done;
    });

    EXPECT_TRUE(outcome.completed);
    EXPECT_FALSE(tracker.snapshot()->running);
    EXPECT_TRUE(tracker.snapshot()->last_error.empty());
}

TEST(RunTrackedTest, FailureIsRecordedAndRethrown) {
    test::TempDir dir;
    const std::string status = dir.file("status.json");
    ProgressTracker tracker(status);

    EXPECT_THROW(run_tracked(tracker, []() -> RunOutcome { throw CheckpointError("disk full", "save"); }),
                 CheckpointError);

    EXPECT_FALSE(tracker.snapshot()->running);
    EXPECT_NE(tracker.snapshot()->last_error.find("disk full"), std::string::npos);

    // The mirrored status must not claim a run is still going
    auto mirrored = ProgressTracker::read_status_file(status);
    ASSERT_TRUE(mirrored.has_value());
    EXPECT_FALSE(mirrored->running);
    EXPECT_NE(mirrored->last_error.find("disk full"), std::string::npos);
}
