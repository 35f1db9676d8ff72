#include "TaskExecutor.hh"
#include "Logger.hh"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    // Written by the child to the error pipe when it cannot reach exec
    struct ChildFailure
    {
        int stage; // 0 = chdir, 1 = exec
        int err;
    };

    TaskError launchError(int err, const string &what)
    {
        return TaskError{TaskErrorKind::LaunchFailed, err, what + ": " + strerror(err)};
    }

    void closeFd(int &fd)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }

    // Only async-signal-safe calls from here on: the parent may be multi-threaded
    [[noreturn]] void failChild(int errFd, int stage)
    {
        ChildFailure failure{stage, errno};
        ssize_t ignored = write(errFd, &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    pid_t waitForChild(pid_t pid, int &status, int options)
    {
        pid_t rc;
        do
        {
            rc = waitpid(pid, &status, options);
        } while (rc < 0 && errno == EINTR);

        return rc;
    }

    void killAndReap(pid_t pid, int &status)
    {
        kill(pid, SIGKILL);
        waitForChild(pid, status, 0);
    }
}

vector<string> TaskExecutor::commandLine(const TaskDescriptor &task, const ExecutorOptions &options)
{
    error_code ec;
    fs::path absolute = fs::absolute(task.path, ec);
    if (ec)
        absolute = task.path;

    vector<string> args;
    if (!options.interpreter.empty())
        args.push_back(options.interpreter);

    args.push_back(absolute.lexically_normal().string());
    return args;
}

TaskOutcome TaskExecutor::execute(const TaskDescriptor &task, const ExecutorOptions &options)
{
    TaskOutcome outcome;
    outcome.name = task.name;
    outcome.startTime = system_clock::now();

    if (options.announce)
        Logger::dualSafeLog("Starting " + task.name + "...");

    Logger::log(LogLevel::Info, task.name, "started", 0, 0);

    // measure end-to-end, process launch included
    auto start = steady_clock::now();

    string output;
    optional<TaskError> error = runProcess(task, options, output);

    outcome.durationMs = duration_cast<milliseconds>(steady_clock::now() - start).count();
    outcome.endTime = system_clock::now();
    outcome.success = !error.has_value();
    outcome.error = std::move(error);
    outcome.output = std::move(output);

    if (outcome.success)
        Logger::log(LogLevel::Info, task.name, "completed", outcome.durationMs, 0);
    else
        Logger::log(LogLevel::Error, task.name, taskErrorKindToString(outcome.error->kind), outcome.durationMs, outcome.error->code);

    return outcome;
}

/*
fork/exec the task, collect its output if buffered, and classify how it ended.
Returns nullopt on a clean zero exit.
*/
optional<TaskError> TaskExecutor::runProcess(const TaskDescriptor &task, const ExecutorOptions &options, string &output)
{
    const bool buffered = options.outputMode == OutputMode::Buffered;

    // Everything the child needs is prepared before fork()
    vector<string> args = commandLine(task, options);
    vector<char *> argv;
    for (auto &a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    string workDir = fs::path(args.back()).parent_path().string();

    // Both pipes are close-on-exec so children forked by other workers never inherit them
    int errPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};

    if (pipe2(errPipe, O_CLOEXEC) == -1)
        return launchError(errno, "failed to create pipe");

    if (buffered && pipe2(outPipe, O_CLOEXEC) == -1)
    {
        int err = errno;
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return launchError(err, "failed to create pipe");
    }

    pid_t pid = fork();

    if (pid == 0)
    {
        if (buffered)
        {
            // dup2 clears close-on-exec on the targets
            if (dup2(outPipe[1], STDOUT_FILENO) == -1 || dup2(outPipe[1], STDERR_FILENO) == -1)
                failChild(errPipe[1], 1);
        }

        if (!workDir.empty() && chdir(workDir.c_str()) == -1)
            failChild(errPipe[1], 0);

        execvp(argv[0], argv.data());
        failChild(errPipe[1], 1);
    }

    if (pid < 0)
    {
        int err = errno;
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return launchError(err, "fork failed");
    }

    closeFd(errPipe[1]);
    closeFd(outPipe[1]);

    // EOF on the error pipe means exec succeeded
    ChildFailure failure{};
    ssize_t n;
    do
    {
        n = read(errPipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    int status = 0;

    if (n == static_cast<ssize_t>(sizeof(failure)))
    {
        closeFd(outPipe[0]);
        waitForChild(pid, status, 0);

        if (failure.stage == 0)
            return launchError(failure.err, "cannot enter directory " + workDir);

        return launchError(failure.err, "failed to launch " + args.front());
    }

    const bool hasDeadline = options.timeoutMs > 0;
    const auto deadline = steady_clock::now() + milliseconds(options.timeoutMs);
    bool timedOut = false;
    bool reaped = false;

    // The deadline passed with the pipe still open. A background process may hold it after the task
    // itself exited, so only a child that is still running counts as timed out.
    auto expired = [&]() -> bool
    {
        if (waitForChild(pid, status, WNOHANG) == pid)
        {
            reaped = true;
            return false;
        }

        return true;
    };

    auto remainingMs = [&]() -> int
    {
        if (!hasDeadline)
            return -1;

        auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    };

    if (buffered)
    {
        char buf[4096];

        while (true)
        {
            int waitMs = remainingMs();
            if (waitMs == 0)
            {
                timedOut = expired();
                break;
            }

            pollfd pfd{outPipe[0], POLLIN, 0};
            int rc = poll(&pfd, 1, waitMs);

            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }

            if (rc == 0)
            {
                timedOut = expired();
                break;
            }

            ssize_t got = read(outPipe[0], buf, sizeof(buf));
            if (got > 0)
                output.append(buf, static_cast<size_t>(got));
            else if (got == 0 || errno != EINTR)
                break;
        }

        closeFd(outPipe[0]);
    }

    if (timedOut)
    {
        killAndReap(pid, status);
    }
    else if (reaped)
    {
        // status already holds the exit of the task itself
    }
    else if (hasDeadline)
    {
        while (true)
        {
            pid_t rc = waitForChild(pid, status, WNOHANG);

            if (rc == pid)
                break;

            if (rc < 0)
                return TaskError{TaskErrorKind::LaunchFailed, errno, string("waitpid failed: ") + strerror(errno)};

            if (remainingMs() == 0)
            {
                timedOut = true;
                killAndReap(pid, status);
                break;
            }

            this_thread::sleep_for(milliseconds(10));
        }
    }
    else if (waitForChild(pid, status, 0) < 0)
    {
        return TaskError{TaskErrorKind::LaunchFailed, errno, string("waitpid failed: ") + strerror(errno)};
    }

    if (timedOut)
        return TaskError{TaskErrorKind::TimedOut, SIGKILL, "timed out after " + to_string(options.timeoutMs) + "ms"};

    if (WIFEXITED(status))
    {
        int code = WEXITSTATUS(status);
        if (code == 0)
            return nullopt;

        return TaskError{TaskErrorKind::NonZeroExit, code, "exit status " + to_string(code)};
    }

    if (WIFSIGNALED(status))
    {
        int sig = WTERMSIG(status);
        return TaskError{TaskErrorKind::Signaled, sig, string("signal: ") + strsignal(sig)};
    }

    return TaskError{TaskErrorKind::NonZeroExit, status, "process terminated abnormally"};
}
