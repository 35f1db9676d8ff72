#include "thread_pool.hh"

ThreadPool::ThreadPool(size_t numThreads) : stop(false)
{
    if (numThreads == 0)
        numThreads = 1;

    // create numThreads new thread
    for (size_t i = 0; i < numThreads; ++i)
        workers.emplace_back([this]()
                             { workerLoop(); });
}

void ThreadPool::workerLoop()
{
    while (true)
    {
        function<void()> task;

        {
            unique_lock lock(queue_mutex);
            cv.wait(lock, [this]()
                    { return stop || !jobs.empty(); });

            // If stopped and no more work → exit thread
            if (stop && jobs.empty())
                return;

            task = std::move(jobs.front()); // Take the job out of the queue
            jobs.pop();
        }

        task();

        if (--activeJobs == 0)
        {
            lock_guard lock(doneMutex);
            allDoneCV.notify_all();
        }
    }
}

void ThreadPool::enqueue(function<void()> job)
{
    activeJobs++;

    {
        lock_guard lock(queue_mutex);
        jobs.emplace(std::move(job));
    }

    cv.notify_one(); // Wake up an idle thread
}

/*
wait until all jobs in the thread pool are complete
*/
void ThreadPool::waitAll()
{
    unique_lock<mutex> lock(doneMutex);

    allDoneCV.wait(lock, [this]
                   { return activeJobs.load() == 0; });
}

size_t ThreadPool::size() const
{
    return workers.size();
}

ThreadPool::~ThreadPool()
{
    {
        lock_guard lock(queue_mutex);
        stop = true; // Set stop flag
    }
    cv.notify_all(); // Wake up all sleeping threads

    for (thread &worker : workers)
    {
        if (worker.joinable()) // Check if thread is still running
            worker.join();     // Wait for thread to end
    }
}
