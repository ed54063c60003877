/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool with per-task cooperative cancellation.
 *
 * Backend calls (fetch, materialize) run here so that the caller can bound
 * its wait with a timeout and, on expiry, request cancellation of exactly
 * the task it abandoned.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace model_keeper {

/**
 * @brief Handle to a submitted task: its result and its private stop source.
 */
template <typename T>
struct PendingTask {
    std::future<T> future;
    std::stop_source stop;

    /// Ask the task to stop; it observes this through its stop_token.
    void cancel() { stop.request_stop(); }
};

class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 0);

    /// Runs every task still queued, then joins the workers.
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a callable taking the task's own stop_token.
    template <std::invocable<std::stop_token> F>
    PendingTask<std::invoke_result_t<F, std::stop_token>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop();

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool shutting_down_{false};
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable<std::stop_token> F>
PendingTask<std::invoke_result_t<F, std::stop_token>> WorkerPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();

    PendingTask<ReturnType> pending;
    pending.future = promise->get_future();
    auto token = pending.stop.get_token();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func),
                          token = std::move(token)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f(token);
                    p->set_value();
                } else {
                    p->set_value(f(token));
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return pending;
}

}  // namespace model_keeper
