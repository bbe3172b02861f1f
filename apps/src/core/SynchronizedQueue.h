#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace StenoBridge {

/**
 * @brief Mutex-protected FIFO shared between producer threads and one consumer loop.
 */
template <typename T>
class SynchronizedQueue {
public:
    void push(T item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(item));
    }

    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
};

} // namespace StenoBridge
