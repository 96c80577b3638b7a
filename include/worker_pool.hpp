#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace volley {

// Shared flag that tells queued work to skip itself.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

// Fixed set of threads draining a FIFO task queue.
class WorkerPool {
public:
    using Task = std::function<void()>;

    // Starts `size` threads (at least one). Throws std::system_error when a
    // thread cannot be created; threads already started are joined first.
    explicit WorkerPool(size_t size);

    // close() then join()
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // hardware_concurrency(), or 1 when unknown
    static size_t default_size();

    // Throws std::logic_error after close().
    void submit(Task task);

    // No new tasks. Queued tasks still run.
    void close();

    // Drops queued tasks and trips the token. Running tasks finish.
    void cancel();

    // Waits for every worker to exit. Requires close().
    void join();

    std::shared_ptr<CancellationToken> token() const { return token_; }

    size_t size() const { return size_; }
    size_t live_workers() const { return live_.load(); }
    size_t pending() const;

private:
    void worker_loop();

    size_t size_;
    std::vector<std::thread> workers_;
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool closed_ = false;
    std::atomic<size_t> live_{0};
    std::shared_ptr<CancellationToken> token_;
};

} // namespace volley
