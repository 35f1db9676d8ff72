#include "Logger.hh"
#include "log_utils.h"

#include <format>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    // Whole seconds, so the clock's sub-second digits stay out of the output
    string formatTime(chrono::system_clock::time_point tp)
    {
        return format("{:%Y-%m-%d %H:%M:%S}", chrono::floor<chrono::seconds>(tp));
    }
}

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::start(const string &filename)
{
    if (running)
        stop();

    // Must lock to safely open log file before any log attempts are made.
    {
        lock_guard<mutex> lock(logMutex);
        // Each run starts a fresh log file
        logFile.open(filename, ios::out | ios::trunc);

        if (!logFile.is_open())
            throw runtime_error("Cannot open log file: " + filename);
    }

    stopFlag = false;
    isReady = false;
    running = true;
    worker = thread(&Logger::workerThread);

    // Wait until worker thread signals it is ready to accept log messages.
    {
        unique_lock<mutex> lock(queueMutex);
        cv.wait(lock, []
                { return isReady.load(); });
    }

    dualSafeLog("=== Run started at " + formatTime(chrono::system_clock::now()));
}

void Logger::stop()
{
    {
        lock_guard<mutex> lock(queueMutex);
        stopFlag = true;
    }

    cv.notify_all();

    // The worker drains the queue before it exits
    if (worker.joinable())
        worker.join();

    lock_guard<mutex> lock(logMutex);
    running = false;

    if (logFile.is_open())
        logFile.close();
}

Logger::~Logger()
{
    stop(); // ensure worker thread stops and joins
}

bool Logger::isFileOpen() const
{
    lock_guard<mutex> lock(logMutex);
    return logFile.is_open();
}

string Logger::timestamps()
{
    return "[" + formatTime(chrono::system_clock::now()) + "]";
}

/*
asynchronous structured logging: the event is queued and written by workerThread()
*/
void Logger::log(LogLevel level, const string &task, const string &status, long long durationMs, int code)
{
    {
        lock_guard<mutex> lock(levelCountMutex);
        levelCounts[level]++;
    }

    if (!running)
        return;

    LogMessage msg{task,
                   status,
                   durationMs,
                   code,
                   level,
                   this_thread::get_id(), // ID of the current thread
                   chrono::system_clock::now()};

    {
        lock_guard<mutex> lock(queueMutex);
        messageQueue.push(std::move(msg));
    }

    cv.notify_one();
}

void Logger::dualSafeLog(const string &message)
{
    string full = timestamps() + "  " + message;

    // Console and file are locked separately so a slow disk never holds up the console
    SAFE_COUT(full);

    {
        lock_guard<mutex> fileLock(logMutex);

        if (!running || !logFile.is_open())
            return;

        logFile << full << '\n';
    }
}

int Logger::levelCount(LogLevel level)
{
    lock_guard<mutex> lock(levelCountMutex);
    auto it = levelCounts.find(level);
    return it == levelCounts.end() ? 0 : it->second;
}

int Logger::threadIndexOf(thread::id id)
{
    lock_guard<mutex> mapLock(threadMapMutex);
    auto it = threadIdMap.find(id);

    if (it != threadIdMap.end())
        return it->second;

    int index = threadCounter++;
    threadIdMap[id] = index;
    return index;
}

void Logger::workerThread()
{
    // Notify start() that the worker is ready before any event is queued
    {
        lock_guard<mutex> lock(queueMutex);
        isReady = true;
    }
    cv.notify_all();

    while (true)
    {
        vector<LogMessage> batch;

        {
            unique_lock<mutex> lock(queueMutex);

            cv.wait(lock, []
                    { return !messageQueue.empty() || stopFlag.load(); });

            // If we're stopping and nothing to log, exit thread
            if (stopFlag.load() && messageQueue.empty())
                break;

            // Take up to 50 events at a time
            while (!messageQueue.empty() && batch.size() < 50)
            {
                batch.push_back(std::move(messageQueue.front()));
                messageQueue.pop();
            }
        }

        writeBatch(batch);
    }
}

void Logger::writeBatch(const vector<LogMessage> &batch)
{
    lock_guard<mutex> lock(logMutex);

    if (!logFile.is_open())
        return;

    for (const auto &msg : batch)
    {
        json line = {
            {"timestamp", formatTime(msg.timestamp)},
            {"thread_id", "thread#" + to_string(threadIndexOf(msg.threadId))},
            {"level", logLevelToString(msg.level)},
            {"task", msg.task},
            {"status", msg.status},
            {"duration_ms", msg.durationMs},
            {"code", msg.code}};

        // Task names come from file names and need not be UTF-8; replace bad bytes instead of throwing
        logFile << line.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    }

    logFile.flush();
}

string Logger::logLevelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";

    case LogLevel::Info:
        return "INFO";

    case LogLevel::Warn:
        return "WARN";

    case LogLevel::Error:
        return "ERROR";
    }

    return "UNKNOWN";
}
