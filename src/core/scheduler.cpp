#include "airmesh/core/scheduler.hpp"
#include "airmesh/util/logger.hpp"

namespace airmesh::core {

Scheduler::Scheduler(ThreadPool& pool) : pool_(pool) {
    timer_thread_ = std::thread(&Scheduler::timer_loop, this);
}

Scheduler::~Scheduler() {
    stop();
}

Scheduler::TaskId Scheduler::schedule_after(Clock::duration delay, std::function<void()> task) {
    TaskId id = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return 0;
        }
        id = next_id_++;
        auto deadline = Clock::now() + delay;
        tasks_.emplace(id, Task{std::move(task), Clock::duration::zero(), deadline, false});
        queue_.emplace(deadline, id);
    }
    condition_.notify_one();
    return id;
}

Scheduler::TaskId Scheduler::schedule_every(Clock::duration interval, std::function<void()> task) {
    TaskId id = 0;
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || interval <= Clock::duration::zero()) {
            return 0;
        }
        id = next_id_++;
        auto deadline = Clock::now() + interval;
        tasks_.emplace(id, Task{std::move(task), interval, deadline, false});
        queue_.emplace(deadline, id);
    }
    condition_.notify_one();
    return id;
}

bool Scheduler::cancel(TaskId id) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return false;
    }

    auto range = queue_.equal_range(it->second.deadline);
    for (auto q = range.first; q != range.second; ++q) {
        if (q->second == id) {
            queue_.erase(q);
            break;
        }
    }
    tasks_.erase(it);
    return true;
}

void Scheduler::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        queue_.clear();
        tasks_.clear();
    }
    condition_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

size_t Scheduler::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void Scheduler::timer_loop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            condition_.wait(lock);
            continue;
        }

        auto next = queue_.begin();
        if (next->first > Clock::now()) {
            condition_.wait_until(lock, next->first);
            continue;
        }

        TaskId id = next->second;
        queue_.erase(next);

        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            continue;
        }

        Task& task = it->second;
        if (task.interval != Clock::duration::zero()) {
            task.deadline += task.interval;
            queue_.emplace(task.deadline, id);
            if (task.running) {
                LOG_DEBUG("Scheduler: periodic task {} still running, skipping a run", id);
                continue;
            }
            task.running = true;
            auto body = task.body;
            lock.unlock();
            bool queued = pool_.submit_detached([this, id, body] {
                try {
                    body();
                } catch (const std::exception& e) {
                    LOG_ERROR("Scheduler: periodic task {} failed: {}", id, e.what());
                }
                std::lock_guard done_lock(mutex_);
                auto running = tasks_.find(id);
                if (running != tasks_.end()) {
                    running->second.running = false;
                }
            });
            lock.lock();
            if (!queued) {
                LOG_DEBUG("Scheduler: thread pool stopped, dropping task {}", id);
            }
        } else {
            auto body = std::move(task.body);
            tasks_.erase(it);
            lock.unlock();
            if (!pool_.submit_detached(std::move(body))) {
                LOG_DEBUG("Scheduler: thread pool stopped, dropping task {}", id);
            }
            lock.lock();
        }
    }
}

} // namespace airmesh::core
