#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace std;

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

// One structured task event, written to the log file as a JSON line
struct LogMessage
{
    string task, status;
    long long durationMs;
    int code;
    LogLevel level;
    thread::id threadId;
    chrono::system_clock::time_point timestamp;
};

/*
Process-wide log sink.

- dualSafeLog() prints a timestamped line to the console and, while a log file
  is open, appends the same line to it.
- log() queues a structured task event; a background worker drains the queue
  and writes one JSON object per line to the log file.

Without start() only the console sink is active.
*/
class Logger
{
public:
    static Logger &instance();

    void start(const string &filename);
    void stop();

    bool isFileOpen() const;

    static string timestamps();

    static void log(LogLevel level, const string &task, const string &status, long long durationMs, int code);

    static void dualSafeLog(const string &message);

    static string logLevelToString(LogLevel level);

    // Number of structured events per level since the process started
    static int levelCount(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    static void workerThread();
    static void writeBatch(const vector<LogMessage> &batch);
    static int threadIndexOf(thread::id id);

    inline static queue<LogMessage> messageQueue; // intermediate buffer
    inline static mutex queueMutex;
    inline static condition_variable cv;
    inline static atomic<bool> stopFlag = false;
    inline static atomic<bool> isReady = false;
    inline static atomic<bool> running = false;

    inline static thread worker;

    // Only 1 log file per process
    inline static ofstream logFile;
    inline static mutex logMutex;

    // Mapping thread::id → readable thread index
    inline static unordered_map<thread::id, int> threadIdMap;
    inline static atomic<int> threadCounter{1}; // Start from 1 for easier debugging than thread #0
    inline static mutex threadMapMutex;

    inline static unordered_map<LogLevel, int> levelCounts;
    inline static mutex levelCountMutex;
};
