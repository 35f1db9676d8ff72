#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "../src/ProgressReporter.hh"

using namespace std::chrono_literals;

namespace
{
    // Collects delivered snapshots from the reporter thread
    struct SnapshotLog
    {
        mutex mtx;
        vector<ProgressSnapshot> snaps;

        ProgressReporter::Sink sink()
        {
            return [this](const ProgressSnapshot &s)
            {
                lock_guard<mutex> lock(mtx);
                snaps.push_back(s);
            };
        }

        size_t count()
        {
            lock_guard<mutex> lock(mtx);
            return snaps.size();
        }
    };
}

TEST(ProgressReporterTest, ReportsPeriodicallyWhileTasksRun)
{
    ProgressTracker tracker(2);
    SnapshotLog log;

    ProgressReporter reporter(tracker, 20ms, log.sink());
    reporter.start();
    this_thread::sleep_for(200ms);
    reporter.stop();

    EXPECT_GE(log.count(), 2u);
    EXPECT_EQ(static_cast<size_t>(reporter.ticksReported()), log.count());

    lock_guard<mutex> lock(log.mtx);
    for (const auto &s : log.snaps)
    {
        EXPECT_EQ(s.completed, 0);
        EXPECT_EQ(s.total, 2);
    }
}

TEST(ProgressReporterTest, StopsItselfOnceEverythingIsDone)
{
    ProgressTracker tracker(1);
    SnapshotLog log;

    ProgressReporter reporter(tracker, 20ms, log.sink());
    reporter.start();
    this_thread::sleep_for(80ms);

    tracker.markTaskDone(10);
    this_thread::sleep_for(80ms);
    size_t afterDone = log.count();

    this_thread::sleep_for(120ms);
    EXPECT_EQ(log.count(), afterDone);

    reporter.stop();
}

TEST(ProgressReporterTest, NothingIsDeliveredAfterStop)
{
    ProgressTracker tracker(3);
    SnapshotLog log;

    ProgressReporter reporter(tracker, 10ms, log.sink());
    reporter.start();
    this_thread::sleep_for(50ms);
    reporter.stop();

    size_t atStop = log.count();
    this_thread::sleep_for(100ms);

    EXPECT_EQ(log.count(), atStop);
}

TEST(ProgressReporterTest, StopDoesNotWaitForThePendingTick)
{
    ProgressTracker tracker(1);
    SnapshotLog log;

    ProgressReporter reporter(tracker, 10s, log.sink());
    reporter.start();

    auto before = chrono::steady_clock::now();
    reporter.stop();
    auto waited = chrono::steady_clock::now() - before;

    EXPECT_LT(waited, 1s);
    EXPECT_EQ(log.count(), 0u);
}

TEST(ProgressReporterTest, NeverChangesTheCounter)
{
    ProgressTracker tracker(5);
    tracker.markTaskDone(10);

    {
        ProgressReporter reporter(tracker, 5ms, [](const ProgressSnapshot &) {});
        reporter.start();
        this_thread::sleep_for(50ms);
    }

    EXPECT_EQ(tracker.completed(), 1);
}

TEST(ProgressReporterTest, DefaultSinkPrintsProgressUpdate)
{
    ProgressTracker tracker(4);
    tracker.markTaskDone(10);

    testing::internal::CaptureStdout();
    ProgressReporter::logSnapshot(tracker.snapshot());
    string console = testing::internal::GetCapturedStdout();

    EXPECT_NE(console.find("Progress update: 1/4 completed (25.0%)"), string::npos);
}
