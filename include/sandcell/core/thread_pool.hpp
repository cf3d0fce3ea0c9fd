#ifndef sandcell_CORE_THREAD_POOL_HPP
#define sandcell_CORE_THREAD_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sandcell {

// Fixed-size worker pool. shutdown() drains queued tasks before joining.
class ThreadPool {
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    // Returns false once the pool is stopping
    bool enqueue(std::function<void()> task);

    // Queued plus running tasks
    size_t pending() const;

    size_t size() const { return workers_.size(); }

    void shutdown();

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()> > tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<size_t> active_;
    bool stop_;
};

} // namespace sandcell

#endif // sandcell_CORE_THREAD_POOL_HPP
