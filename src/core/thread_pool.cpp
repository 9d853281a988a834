#include "airmesh/core/thread_pool.hpp"
#include "airmesh/util/logger.hpp"
#include <algorithm>

namespace airmesh::core {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        // Handshakes block a worker each; keep enough for a few peers at once
        num_threads = std::max(4u, std::thread::hardware_concurrency());
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_.load(std::memory_order_relaxed) || !tasks_.empty();
            });

            if (stop_.load(std::memory_order_relaxed) && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("ThreadPool: task failed: {}", e.what());
        } catch (...) {
            LOG_ERROR("ThreadPool: task failed with a non-standard exception");
        }
    }
}

bool ThreadPool::submit_detached(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (stop_) {
            return false;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stop_.load(std::memory_order_relaxed)) {
            return;
        }
        stop_.store(true, std::memory_order_relaxed);
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace airmesh::core
