/**
 * @file blocking_bridge.hpp
 * @brief Worker pool that turns blocking calls into futures
 *
 * Engine clients and remote API SDKs are synchronous. Each sandbox owns a
 * BlockingBridge and dispatches every such call through it, so a slow
 * engine call never stalls the thread that issued the operation.
 *
 * **Deadline Handling**:
 * ```
 *   caller ──Submit──▶ queue ──▶ worker ──▶ fn() ──┐
 *      ▲                                           ├─▶ first one settles the future
 *      └──────────── future ◀── timer thread ──────┘   (on_timeout() at the deadline)
 * ```
 * A timed-out task keeps running on its worker until it returns; its late
 * result is discarded.
 *
 * @date 2026
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace sandkit {
namespace utils {

/**
 * @class BlockingBridge
 * @brief Fixed-size worker pool with a dedicated deadline timer
 *
 * **Shutdown**: queued tasks are abandoned (their futures report
 * std::future_errc::broken_promise); running tasks are joined. Must not be
 * destroyed from one of its own workers.
 *
 * **Usage Example**:
 * @code
 * BlockingBridge bridge(2, "docker");
 *
 * auto future = bridge.SubmitWithDeadline(
 *     [client]() { return client->Execute(request); },
 *     std::chrono::seconds(35),
 *     []() { return CommandResult::TimedOut(30); });
 *
 * CommandResult result = future.get();
 * @endcode
 */
class BlockingBridge {
public:
    /**
     * @brief Start worker and timer threads
     * @param worker_count Number of workers (at least one is started)
     * @param name Label used in log messages
     */
    explicit BlockingBridge(std::size_t worker_count = 2, std::string name = "bridge");

    ~BlockingBridge();

    BlockingBridge(const BlockingBridge&) = delete;
    BlockingBridge& operator=(const BlockingBridge&) = delete;

    /**
     * @brief Run fn on a worker
     * @return Future carrying fn's result or exception
     * @throws std::runtime_error if the bridge is shut down
     */
    template <typename F>
    auto Submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>>;

    /**
     * @brief Run fn on a worker, settling with on_timeout() if it is not done in time
     *
     * The deadline covers time spent queued as well as running. Exceptions
     * from fn or on_timeout are delivered through the future.
     *
     * @param fn Blocking call
     * @param deadline Time budget measured from submission
     * @param on_timeout Produces the value used when the deadline wins
     * @throws std::runtime_error if the bridge is shut down
     */
    template <typename F, typename TimeoutFn>
    auto SubmitWithDeadline(F&& fn, std::chrono::milliseconds deadline, TimeoutFn&& on_timeout)
        -> std::future<std::invoke_result_t<std::decay_t<F>&>>;

    /**
     * @brief Abandon queued work and join all threads (idempotent)
     */
    void Shutdown();

    std::size_t GetWorkerCount() const { return workers_.size(); }
    std::size_t GetPendingCount() const;
    const std::string& GetName() const { return name_; }

private:
    void Enqueue(std::function<void()> task);
    void ScheduleTimer(std::chrono::steady_clock::time_point when, std::function<void()> action);
    void WorkerLoop();
    void TimerLoop();

    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_{false};

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::multimap<std::chrono::steady_clock::time_point, std::function<void()>> timers_;
    std::thread timer_thread_;
    bool timer_stopping_{false};
};

/**
 * @brief Future that is already satisfied
 */
inline std::future<void> MakeReadyFuture() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

/**
 * @brief Future that already holds an exception
 */
template <typename T>
std::future<T> MakeFailedFuture(std::exception_ptr error) {
    std::promise<T> promise;
    promise.set_exception(std::move(error));
    return promise.get_future();
}

// ============================================================================
// TEMPLATE IMPLEMENTATION
// ============================================================================

template <typename F>
auto BlockingBridge::Submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
    using R = std::invoke_result_t<std::decay_t<F>&>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
}

template <typename F, typename TimeoutFn>
auto BlockingBridge::SubmitWithDeadline(F&& fn, std::chrono::milliseconds deadline,
                                        TimeoutFn&& on_timeout)
    -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
    using R = std::invoke_result_t<std::decay_t<F>&>;

    struct SharedState {
        std::promise<R> promise;
        std::atomic<bool> settled{false};
    };

    auto state = std::make_shared<SharedState>();
    auto future = state->promise.get_future();

    Enqueue([state, task = std::decay_t<F>(std::forward<F>(fn))]() mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                task();
                if (!state->settled.exchange(true)) {
                    state->promise.set_value();
                }
            } else {
                R value = task();
                if (!state->settled.exchange(true)) {
                    state->promise.set_value(std::move(value));
                }
            }
        } catch (...) {
            // Forwarded to the waiter unless the deadline already settled the future
            if (!state->settled.exchange(true)) {
                state->promise.set_exception(std::current_exception());
            }
        }
    });

    // The timer only observes the state; an abandoned task releases it and
    // the future reports broken_promise
    std::weak_ptr<SharedState> weak_state = state;
    ScheduleTimer(std::chrono::steady_clock::now() + deadline,
                  [weak_state, on_timeout = std::decay_t<TimeoutFn>(
                                   std::forward<TimeoutFn>(on_timeout))]() mutable {
        auto locked = weak_state.lock();
        if (!locked || locked->settled.exchange(true)) {
            return;
        }
        try {
            if constexpr (std::is_void_v<R>) {
                on_timeout();
                locked->promise.set_value();
            } else {
                locked->promise.set_value(on_timeout());
            }
        } catch (...) {
            locked->promise.set_exception(std::current_exception());
        }
    });

    return future;
}

} // namespace utils
} // namespace sandkit
