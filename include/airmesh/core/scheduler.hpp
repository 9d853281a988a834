#pragma once

#include "airmesh/core/thread_pool.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace airmesh::core {

// Delayed and periodic tasks. A single timer thread sleeps until the next
// deadline and hands due tasks to the ThreadPool, so task bodies may block.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TaskId = uint64_t;

    explicit Scheduler(ThreadPool& pool);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Returns 0 if the scheduler is stopped
    TaskId schedule_after(Clock::duration delay, std::function<void()> task);

    // First run after one interval; a run is skipped while the previous
    // one is still executing
    TaskId schedule_every(Clock::duration interval, std::function<void()> task);

    // Returns false if the task already fired (one-shot) or is unknown
    bool cancel(TaskId id);

    // Drops all pending tasks and joins the timer thread
    void stop();

    size_t pending() const;

private:
    struct Task {
        std::function<void()> body;
        Clock::duration interval{};  // zero for one-shot tasks
        Clock::time_point deadline;
        bool running = false;
    };

    void timer_loop();

    ThreadPool& pool_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::multimap<Clock::time_point, TaskId> queue_;
    std::unordered_map<TaskId, Task> tasks_;
    TaskId next_id_ = 1;
    bool stopping_ = false;

    std::thread timer_thread_;
};

} // namespace airmesh::core
