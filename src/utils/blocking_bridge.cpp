/**
 * @file blocking_bridge.cpp
 * @brief Worker and timer loops of the blocking-call bridge
 *
 * @date 2026
 */

#include "sandkit/utils/blocking_bridge.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandkit {
namespace utils {

BlockingBridge::BlockingBridge(std::size_t worker_count, std::string name)
    : name_(std::move(name)) {
    if (worker_count == 0) {
        worker_count = 1;
    }

    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&BlockingBridge::WorkerLoop, this);
    }
    timer_thread_ = std::thread(&BlockingBridge::TimerLoop, this);

    spdlog::debug("Bridge '{}' started with {} workers", name_, worker_count);
}

BlockingBridge::~BlockingBridge() {
    Shutdown();
}

// ============================================================================
// SHUTDOWN
// ============================================================================

void BlockingBridge::Shutdown() {
    std::deque<std::function<void()>> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        abandoned.swap(tasks_);
    }
    cv_.notify_all();

    if (!abandoned.empty()) {
        spdlog::debug("Bridge '{}' abandoning {} queued tasks", name_, abandoned.size());
    }
    abandoned.clear();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::multimap<std::chrono::steady_clock::time_point, std::function<void()>> pending_timers;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_stopping_ = true;
        pending_timers.swap(timers_);
    }
    timer_cv_.notify_all();
    pending_timers.clear();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    spdlog::debug("Bridge '{}' stopped", name_);
}

std::size_t BlockingBridge::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

// ============================================================================
// QUEUEING
// ============================================================================

void BlockingBridge::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Bridge '" + name_ + "' is shut down");
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void BlockingBridge::ScheduleTimer(std::chrono::steady_clock::time_point when,
                                   std::function<void()> action) {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (timer_stopping_) {
            return;
        }
        timers_.emplace(when, std::move(action));
    }
    timer_cv_.notify_one();
}

// ============================================================================
// THREAD LOOPS
// ============================================================================

void BlockingBridge::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        // Tasks deliver their own results and exceptions through futures
        task();
    }
}

void BlockingBridge::TimerLoop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!timer_stopping_) {
        if (timers_.empty()) {
            timer_cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin()->first;
        if (std::chrono::steady_clock::now() < next) {
            timer_cv_.wait_until(lock, next);
            continue;
        }

        auto action = std::move(timers_.begin()->second);
        timers_.erase(timers_.begin());

        lock.unlock();
        action();
        lock.lock();
    }
}

} // namespace utils
} // namespace sandkit
