#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "Logger.hh"

// Point-in-time view of a run's progress
struct ProgressSnapshot
{
    int completed = 0;
    int total = 0;
    double percent = 0.0;
    long long elapsedMs = 0;
};

/*
Shared completion counter for one run.

✅ Counts finished tasks (atomic, safe to call from every worker)
✅ Keeps a running average of task durations for the closing line
✅ Formats the "[done/total - pct%]" tags and progress snapshots
*/
class ProgressTracker
{
public:
    explicit ProgressTracker(int taskCount);

    // Called once per task, right after its outcome exists. Returns the new completed count.
    int markTaskDone(long long durationMs);

    // Log the closing line of the run
    void finish();

    int completed() const;
    int total() const;
    bool isComplete() const;

    ProgressSnapshot snapshot() const;

    // "[3/26 - 11.5%]"
    string counterTag(int completedCount) const;

    // "3/26 completed (11.5%) - Elapsed: 12.004s"
    static string formatSnapshot(const ProgressSnapshot &snap);

    void setEnableColor(bool enable);
    string colorText(const string &text, const string &colorCode) const;

private:
    // Total number of tasks in the run
    int totalTasks;
    // Number of finished tasks
    atomic<int> done{0};
    // Total duration (ms) of all finished tasks
    atomic<long long> durationSum{0};

    chrono::steady_clock::time_point startTime;
    bool enableColor = false;

    long long averageDuration() const;
    double percentOf(int completedCount) const;
};
