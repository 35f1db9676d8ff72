#include "ProgressTracker.hh"
#include "TaskOutcome.hh"

#include <iomanip>
#include <sstream>

ProgressTracker::ProgressTracker(int taskCount)
    : totalTasks(taskCount < 0 ? 0 : taskCount), startTime(chrono::steady_clock::now()) {}

void ProgressTracker::setEnableColor(bool enable)
{
    enableColor = enable;
}

string ProgressTracker::colorText(const string &text, const string &colorCode) const
{
    return enableColor ? ("\033[" + colorCode + "m" + text + "\033[0m") : text;
}

int ProgressTracker::markTaskDone(long long durationMs)
{
    durationSum += durationMs;
    return ++done;
}

int ProgressTracker::completed() const
{
    return done.load();
}

int ProgressTracker::total() const
{
    return totalTasks;
}

bool ProgressTracker::isComplete() const
{
    return done.load() >= totalTasks;
}

double ProgressTracker::percentOf(int completedCount) const
{
    if (totalTasks == 0)
        return 100.0;

    return static_cast<double>(completedCount) / totalTasks * 100.0;
}

ProgressSnapshot ProgressTracker::snapshot() const
{
    ProgressSnapshot snap;
    snap.completed = done.load();
    snap.total = totalTasks;
    snap.percent = percentOf(snap.completed);
    snap.elapsedMs = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - startTime).count();
    return snap;
}

string ProgressTracker::counterTag(int completedCount) const
{
    stringstream ss;
    ss << "[" << completedCount << "/" << totalTasks << " - "
       << fixed << setprecision(1) << percentOf(completedCount) << "%]";
    return ss.str();
}

string ProgressTracker::formatSnapshot(const ProgressSnapshot &snap)
{
    stringstream ss;
    ss << snap.completed << "/" << snap.total << " completed ("
       << fixed << setprecision(1) << snap.percent << "%) - Elapsed: "
       << formatDuration(snap.elapsedMs);
    return ss.str();
}

void ProgressTracker::finish()
{
    auto totalTime = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - startTime).count();

    Logger::dualSafeLog(colorText("All tasks finished: " + to_string(done.load()) + "/" + to_string(totalTasks) +
                                      " in " + formatDuration(totalTime) +
                                      " (average task " + formatDuration(averageDuration()) + ")",
                                  "36")); // cyan
}

long long ProgressTracker::averageDuration() const
{
    int count = done.load();

    return count == 0 ? 0 : durationSum.load() / count;
}

