#include "ProgressReporter.hh"

ProgressReporter::ProgressReporter(const ProgressTracker &tracker, chrono::milliseconds interval, Sink sink)
    : tracker(tracker), interval(interval), sink(sink ? std::move(sink) : Sink(&ProgressReporter::logSnapshot)),
      io_context(), timer(io_context)
{
}

ProgressReporter::~ProgressReporter()
{
    stop();
}

void ProgressReporter::logSnapshot(const ProgressSnapshot &snap)
{
    Logger::dualSafeLog("📊 Progress update: " + ProgressTracker::formatSnapshot(snap));
}

void ProgressReporter::start()
{
    {
        lock_guard<mutex> lock(stateMutex);
        if (started || stopped)
            return;
        started = true;
    }

    // The first wait is armed before the io_context thread exists
    scheduleTick();
    worker_thread = std::thread([this]()
                                { io_context.run(); });
}

void ProgressReporter::stop()
{
    {
        lock_guard<mutex> lock(stateMutex);
        stopped = true;
    }

    // Abandons a pending wait instead of sleeping it out
    io_context.stop();

    if (worker_thread.joinable())
        worker_thread.join();
}

int ProgressReporter::ticksReported() const
{
    return ticks.load();
}

void ProgressReporter::scheduleTick()
{
    timer.expires_after(interval);
    timer.async_wait([this](const asio::error_code &ec)
                     { onTick(ec); });
}

void ProgressReporter::onTick(const asio::error_code &ec)
{
    if (ec == asio::error::operation_aborted)
        return;

    lock_guard<mutex> lock(stateMutex);

    if (stopped)
        return;

    ProgressSnapshot snap = tracker.snapshot();

    // Every task is done: let io_context.run() run out of work
    if (snap.completed >= snap.total)
        return;

    sink(snap);
    ++ticks;

    scheduleTick();
}
