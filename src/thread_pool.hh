#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>

using namespace std;

class ThreadPool
{
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    void enqueue(function<void()> job);

    // Block until every enqueued job has finished running
    void waitAll();

    size_t size() const;

private:
    // List of worker threads
    vector<thread> workers;
    // Queue jobs
    queue<function<void()>> jobs;
    mutex queue_mutex;
    condition_variable cv;

    // Jobs enqueued but not finished yet
    atomic<int> activeJobs{0};
    mutex doneMutex;
    condition_variable allDoneCV; // Notified when `activeJobs == 0`

    // Stop stream flag
    atomic<bool> stop;

    void workerLoop();
};
