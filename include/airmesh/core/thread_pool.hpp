#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace airmesh::core {

// Worker pool for blocking protocol work (handshakes, stability probes)
// and for tasks fired by the Scheduler
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false if the pool is stopped and the task was dropped.
    // Exceptions escaping the task are logged.
    bool submit_detached(std::function<void()> task);

    size_t num_threads() const { return workers_.size(); }

    // Runs the queued tasks to completion, then joins the workers
    void stop();

    bool running() const { return !stop_.load(std::memory_order_relaxed); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;

    std::atomic<bool> stop_{false};
};

} // namespace airmesh::core
