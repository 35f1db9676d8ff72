#pragma once
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

// Multi-producer completion channel: producers never block on capacity,
// the consumer drains everything once the producers are done.
template <typename T>
class CompletionQueue
{
private:
    std::mutex mutex;
    std::deque<T> items;

public:
    void push(T &&item)
    {
        std::lock_guard<std::mutex> lock(mutex);
        items.push_back(std::move(item));
    }

    // Everything pushed so far, in arrival order
    std::vector<T> drain()
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<T> out;
        out.reserve(items.size());

        while (!items.empty())
        {
            out.push_back(std::move(items.front()));
            items.pop_front();
        }

        return out;
    }
};
