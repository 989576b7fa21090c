#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

/*! Blocking multi-producer queue.
 *
 * pop() waits until there is data.
 */
template <typename T>
class Queue
{
public:
    using type_t = T;

    Queue() = default;

    void push(T && data)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(data));
        }
        cv_.notify_one();
    }

    T pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]{ return !queue_.empty(); });
        T out = std::move(queue_.front());
        queue_.pop_front();
        return out;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
};
