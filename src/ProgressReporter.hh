#pragma once

#include "ProgressTracker.hh"

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

/*
Periodic progress printer for parallel runs.

Ticks on an asio::steady_timer driven by its own io_context thread, reads the tracker's counter and
hands a snapshot to the sink. It never writes to the tracker. It stops rescheduling once every
task is done, and after stop() returns no snapshot is delivered any more.
*/
class ProgressReporter
{
public:
    using Sink = function<void(const ProgressSnapshot &)>;

    ProgressReporter(const ProgressTracker &tracker, chrono::milliseconds interval, Sink sink = nullptr);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    void start();
    void stop();

    // Number of snapshots delivered so far
    int ticksReported() const;

    static void logSnapshot(const ProgressSnapshot &snap);

private:
    void scheduleTick();
    void onTick(const asio::error_code &ec);

    const ProgressTracker &tracker;
    chrono::milliseconds interval;
    Sink sink;

    asio::io_context io_context;
    asio::steady_timer timer;
    std::thread worker_thread;

    // Held while a snapshot is delivered so stop() cannot return in the middle of one
    mutex stateMutex;
    bool stopped = false;
    bool started = false;
    atomic<int> ticks{0};
};
