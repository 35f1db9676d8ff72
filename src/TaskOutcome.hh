#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <sstream>
#include <iomanip>

#include <nlohmann/json.hpp>

using namespace std;
using namespace chrono;

// Why a task did not succeed
enum class TaskErrorKind
{
    LaunchFailed, // interpreter missing, permission denied, fork/pipe failure
    NonZeroExit,
    Signaled,
    TimedOut
};

struct TaskError
{
    TaskErrorKind kind = TaskErrorKind::NonZeroExit;
    // errno for LaunchFailed, exit status for NonZeroExit, signal number for Signaled/TimedOut
    int code = 0;
    string message;
};

inline string taskErrorKindToString(TaskErrorKind kind)
{
    switch (kind)
    {
    case TaskErrorKind::LaunchFailed:
        return "launch_failed";
    case TaskErrorKind::NonZeroExit:
        return "nonzero_exit";
    case TaskErrorKind::Signaled:
        return "signaled";
    case TaskErrorKind::TimedOut:
        return "timed_out";
    }

    return "unknown";
}

/*
The result of running one task. Produced once by TaskExecutor and never modified afterwards.
success is true exactly when error is empty.
*/
struct TaskOutcome
{
    string name;
    bool success = false;
    long long durationMs = 0;

    optional<TaskError> error; // Only available if failed
    string output;             // Combined stdout/stderr, buffered mode only

    system_clock::time_point startTime;
    system_clock::time_point endTime;

    nlohmann::json toJSON() const
    {
        nlohmann::json j = {
            {"name", name},
            {"success", success},
            {"duration_ms", durationMs},
            {"end_time", system_clock::to_time_t(endTime)}};

        if (error.has_value())
        {
            j["error"] = {
                {"kind", taskErrorKindToString(error->kind)},
                {"code", error->code},
                {"message", error->message}};
        }

        if (!output.empty())
            j["output"] = output;

        return j;
    }
};

/*
Human readable duration: "850ms", "3.042s", "2m5.300s"
*/
inline string formatDuration(long long ms)
{
    if (ms < 0)
        ms = 0;

    if (ms < 1000)
        return to_string(ms) + "ms";

    long long minutes = ms / 60000;
    long long remMs = ms % 60000;

    ostringstream ss;
    if (minutes > 0)
        ss << minutes << "m";

    ss << remMs / 1000 << "." << setw(3) << setfill('0') << remMs % 1000 << "s";
    return ss.str();
}
