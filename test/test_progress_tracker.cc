#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "../src/ProgressTracker.hh"

TEST(ProgressTrackerTest, MarkTaskDoneAndFinish)
{
    const int totalTasks = 4;
    ProgressTracker tracker(totalTasks);

    for (int i = 0; i < totalTasks; ++i)
        EXPECT_EQ(tracker.markTaskDone(50 + i * 10), i + 1);

    EXPECT_EQ(tracker.completed(), totalTasks);
    EXPECT_TRUE(tracker.isComplete());

    testing::internal::CaptureStdout();
    tracker.finish();
    string console = testing::internal::GetCapturedStdout();

    EXPECT_NE(console.find("All tasks finished: 4/4"), string::npos);
}

TEST(ProgressTrackerTest, CounterTagShowsFractionAndPercent)
{
    ProgressTracker tracker(3);

    EXPECT_EQ(tracker.counterTag(1), "[1/3 - 33.3%]");
    EXPECT_EQ(tracker.counterTag(3), "[3/3 - 100.0%]");
}

TEST(ProgressTrackerTest, SnapshotReadsCounter)
{
    ProgressTracker tracker(26);
    tracker.markTaskDone(100);
    tracker.markTaskDone(100);
    tracker.markTaskDone(100);

    ProgressSnapshot snap = tracker.snapshot();

    EXPECT_EQ(snap.completed, 3);
    EXPECT_EQ(snap.total, 26);
    EXPECT_NEAR(snap.percent, 11.54, 0.01);
    EXPECT_GE(snap.elapsedMs, 0);

    string text = ProgressTracker::formatSnapshot(snap);
    EXPECT_EQ(text.rfind("3/26 completed (11.5%) - Elapsed: ", 0), 0u);
}

TEST(ProgressTrackerTest, EmptyRunIsComplete)
{
    ProgressTracker tracker(0);

    EXPECT_TRUE(tracker.isComplete());
    EXPECT_DOUBLE_EQ(tracker.snapshot().percent, 100.0);
}

TEST(ProgressTrackerTest, FinishReportsAverageTaskDuration)
{
    ProgressTracker tracker(2);
    tracker.markTaskDone(1000);
    tracker.markTaskDone(3000);

    testing::internal::CaptureStdout();
    tracker.finish();
    string console = testing::internal::GetCapturedStdout();

    EXPECT_NE(console.find("(average task 2.000s)"), string::npos);
}

TEST(ProgressTrackerTest, ConcurrentMarksAreAllCounted)
{
    const int threads = 8;
    const int perThread = 250;
    ProgressTracker tracker(threads * perThread);

    vector<thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back([&tracker]()
                             {
            for (int i = 0; i < perThread; ++i)
                tracker.markTaskDone(1); });
    }

    for (auto &w : workers)
        w.join();

    EXPECT_EQ(tracker.completed(), threads * perThread);
    EXPECT_TRUE(tracker.isComplete());
}

TEST(ProgressTrackerTest, ColorIsOptional)
{
    ProgressTracker tracker(1);

    EXPECT_EQ(tracker.colorText("done", "32"), "done");

    tracker.setEnableColor(true);
    EXPECT_EQ(tracker.colorText("done", "32"), "\033[32mdone\033[0m");
}
