/*
 * sandcell - Thread Pool Implementation
 */
#include <sandcell/core/thread_pool.hpp>
#include <sandcell/core/logger.hpp>

#include <exception>

namespace sandcell {

ThreadPool::ThreadPool(size_t threads)
    : active_(0)
    , stop_(false)
{
    if (threads == 0) threads = 1;
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_.load();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();
    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            workers_[i].join();
        }
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[ThreadPool] Task threw: %s", e.what());
        }
        --active_;
    }
}

} // namespace sandcell
