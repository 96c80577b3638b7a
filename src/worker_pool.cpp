#include "worker_pool.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <system_error>

namespace volley {

WorkerPool::WorkerPool(size_t size)
    : size_(size == 0 ? 1 : size),
      token_(std::make_shared<CancellationToken>()) {
    workers_.reserve(size_);
    try {
        for (size_t i = 0; i < size_; ++i) {
            live_.fetch_add(1);
            workers_.emplace_back(&WorkerPool::worker_loop, this);
        }
    } catch (const std::system_error& e) {
        live_.fetch_sub(1);
        log_info() << "Could not start worker " << workers_.size() + 1 << " of "
                   << size_ << ": " << e.what();
        close();
        join();
        throw;
    }
    log_debug() << "Worker pool started with " << size_ << " threads";
}

WorkerPool::~WorkerPool() {
    close();
    join();
}

size_t WorkerPool::default_size() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::logic_error("submit() on a closed worker pool");
        }
        tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

void WorkerPool::cancel() {
    token_->cancel();
    size_t dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = tasks_.size();
        tasks_.clear();
    }
    condition_.notify_all();
    if (dropped > 0) {
        log_debug() << "Cancelled " << dropped << " queued tasks";
    }
}

void WorkerPool::join() {
    bool joined_any = false;
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
            joined_any = true;
        }
    }
    if (joined_any) {
        log_debug() << "Worker pool shut down";
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                break; // closed and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_info() << "Worker task failed: " << e.what();
        }
    }
    live_.fetch_sub(1);
}

} // namespace volley
