#pragma once

#include "TaskCatalog.hh"
#include "TaskOutcome.hh"

#include <string>
#include <vector>

enum class OutputMode
{
    Streamed, // child writes straight to the harness's stdout/stderr
    Buffered  // child stdout+stderr are captured into TaskOutcome::output
};

struct ExecutorOptions
{
    // Program the task file is handed to; empty runs the file itself
    string interpreter = "python3";
    OutputMode outputMode = OutputMode::Buffered;
    // Kill the child after this many milliseconds (0 = wait forever)
    int timeoutMs = 0;
    // Print "Starting <name>..." when the task is launched
    bool announce = true;
};

/*
Runs one task as a child process and turns whatever happens into a TaskOutcome.

The child is started as `<interpreter> <absolute task path>` with its working directory set to the
directory holding the task file. Launch failures, non-zero exits, signals and timeouts are all
reported through TaskOutcome::error; execute() never throws for a task-level failure.
*/
class TaskExecutor
{
public:
    static TaskOutcome execute(const TaskDescriptor &task, const ExecutorOptions &options);

    // argv the child is exec'd with
    static vector<string> commandLine(const TaskDescriptor &task, const ExecutorOptions &options);

private:
    static optional<TaskError> runProcess(const TaskDescriptor &task, const ExecutorOptions &options, string &output);
};
