#include "TaskScheduler.hh"
#include "CompletionQueue.hh"
#include "ProgressReporter.hh"
#include "thread_pool.hh"
#include "Logger.hh"

#include <algorithm>
#include <stdexcept>

TaskScheduler::TaskScheduler(SchedulerOptions options)
    : opts(std::move(options))
{
    ExecutorOptions executorOptions = opts.executor;

    // In sequential mode the scheduler prints the launch line itself, with the progress tag
    if (opts.policy == SchedulePolicy::Sequential)
        executorOptions.announce = false;

    runner = [executorOptions](const TaskDescriptor &task)
    { return TaskExecutor::execute(task, executorOptions); };
}

TaskScheduler::TaskScheduler(SchedulerOptions options, Runner runner)
    : opts(std::move(options)), runner(std::move(runner))
{
}

const SchedulerOptions &TaskScheduler::options() const
{
    return opts;
}

string TaskScheduler::policyToString(SchedulePolicy policy)
{
    return policy == SchedulePolicy::Sequential ? "sequential" : "parallel";
}

vector<TaskOutcome> TaskScheduler::run(const vector<TaskDescriptor> &tasks)
{
    Logger::dualSafeLog("Starting " + policyToString(opts.policy) + " execution of " + to_string(tasks.size()) + " tasks...");
    Logger::dualSafeLog(string(61, '='));

    vector<TaskOutcome> outcomes = opts.policy == SchedulePolicy::Sequential
                                       ? runSequential(tasks)
                                       : runParallel(tasks);

    // Exactly one outcome per submitted task
    if (outcomes.size() != tasks.size())
        throw runtime_error("scheduler produced " + to_string(outcomes.size()) + " outcomes for " +
                            to_string(tasks.size()) + " tasks");

    return outcomes;
}

void TaskScheduler::reportCompletion(const ProgressTracker &tracker, const TaskOutcome &outcome, int completedCount) const
{
    string tag = completedCount > 0 ? " " + tracker.counterTag(completedCount) : "";

    if (outcome.success)
    {
        Logger::dualSafeLog(tracker.colorText("✓ " + outcome.name + " completed in " + formatDuration(outcome.durationMs), "32") + tag);
    }
    else
    {
        string cause = outcome.error ? outcome.error->message : "unknown error";
        Logger::dualSafeLog(tracker.colorText("✗ " + outcome.name + " failed in " + formatDuration(outcome.durationMs) + ": " + cause, "31") + tag);
    }
}

/*
One task at a time in catalog order. Progress is (index+1)/total, printed with the launch line.
*/
vector<TaskOutcome> TaskScheduler::runSequential(const vector<TaskDescriptor> &tasks)
{
    ProgressTracker tracker(static_cast<int>(tasks.size()));
    tracker.setEnableColor(opts.enableColor);

    vector<TaskOutcome> outcomes;
    outcomes.reserve(tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i)
    {
        const TaskDescriptor &task = tasks[i];

        Logger::dualSafeLog(tracker.counterTag(static_cast<int>(i) + 1) + " Starting " + task.name + "...");

        TaskOutcome outcome = runner(task);
        tracker.markTaskDone(outcome.durationMs);

        reportCompletion(tracker, outcome, 0);

        outcomes.push_back(std::move(outcome));
    }

    tracker.finish();
    return outcomes;
}

/*
All tasks at once. Each unit bumps the shared counter as soon as its outcome exists and publishes
the outcome on the completion queue; the periodic reporter only reads the counter.
*/
vector<TaskOutcome> TaskScheduler::runParallel(const vector<TaskDescriptor> &tasks)
{
    ProgressTracker tracker(static_cast<int>(tasks.size()));
    tracker.setEnableColor(opts.enableColor);

    if (tasks.empty())
    {
        tracker.finish();
        return {};
    }

    size_t workers = tasks.size();
    if (opts.maxParallel > 0)
        workers = min(workers, static_cast<size_t>(opts.maxParallel));

    CompletionQueue<TaskOutcome> completed;
    ProgressReporter reporter(tracker, opts.progressInterval);

    {
        ThreadPool pool(workers);
        reporter.start();

        for (const auto &task : tasks)
        {
            pool.enqueue([this, &task, &tracker, &completed]()
                         {
                TaskOutcome outcome = runner(task);
                int count = tracker.markTaskDone(outcome.durationMs);
                reportCompletion(tracker, outcome, count);
                completed.push(std::move(outcome)); });
        }

        // Barrier: every unit has published its outcome
        pool.waitAll();
        reporter.stop();
    }

    tracker.finish();

    return completed.drain();
}
