#pragma once

#include "TaskExecutor.hh"
#include "ProgressTracker.hh"

#include <chrono>
#include <functional>
#include <vector>

enum class SchedulePolicy
{
    Sequential,
    Parallel
};

struct SchedulerOptions
{
    SchedulePolicy policy = SchedulePolicy::Parallel;
    ExecutorOptions executor;
    // Parallel only: worker cap, 0 = one worker per task
    int maxParallel = 0;
    // Parallel only: period of the progress snapshots
    chrono::milliseconds progressInterval = chrono::seconds(10);
    bool enableColor = false;
};

/*
Drives the resolved tasks through a runner (TaskExecutor by default) and returns exactly one
outcome per task.

- Sequential: catalog order, one task at a time, progress reported around each task.
- Parallel: every task starts at once (or up to maxParallel), outcomes come back in completion
  order, a ProgressReporter prints periodic snapshots until the barrier is passed.
*/
class TaskScheduler
{
public:
    using Runner = function<TaskOutcome(const TaskDescriptor &)>;

    explicit TaskScheduler(SchedulerOptions options);
    TaskScheduler(SchedulerOptions options, Runner runner);

    vector<TaskOutcome> run(const vector<TaskDescriptor> &tasks);

    const SchedulerOptions &options() const;

    static string policyToString(SchedulePolicy policy);

private:
    vector<TaskOutcome> runSequential(const vector<TaskDescriptor> &tasks);
    vector<TaskOutcome> runParallel(const vector<TaskDescriptor> &tasks);

    void reportCompletion(const ProgressTracker &tracker, const TaskOutcome &outcome, int completedCount) const;

    SchedulerOptions opts;
    Runner runner;
};
