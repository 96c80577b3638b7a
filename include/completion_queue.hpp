#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace volley {

// Multi-producer channel that hands finished work to one consumer in the
// order it completed.
template <typename T>
class CompletionQueue {
public:
    // Discarded once the queue is closed
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            items_.push_back(std::move(value));
        }
        ready_.notify_one();
    }

    // Blocks for the next item. nullopt once closed and empty.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace volley
