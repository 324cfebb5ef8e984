/**
 * @file thread_pool.hpp
 * @brief std::jthread-based invocation pool with a bounded queue.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace exec_sandbox {

/**
 * @brief Fixed set of std::jthread workers fed from a bounded FIFO queue.
 *
 * submit() refuses work with ErrorKind::Busy once `max_queued` tasks are
 * waiting, so a flood of requests turns into fast rejections instead of an
 * unbounded backlog. Tasks already queued when the pool is destroyed still
 * run before the workers join.
 */
class ThreadPool {
public:
    static constexpr size_t kDefaultMaxQueued = 64;

    explicit ThreadPool(size_t num_threads = 0, size_t max_queued = kDefaultMaxQueued);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution. Exceptions it throws reach the future.
    template <std::invocable F>
    Result<std::future<std::invoke_result_t<F>>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t max_queued() const noexcept { return max_queued_; }

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    size_t max_queued_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
Result<std::future<std::invoke_result_t<F>>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (task_queue_.size() >= max_queued_) {
            return Error{ErrorKind::Busy,
                         "Queue full (" + std::to_string(max_queued_) + " pending)"};
        }
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return std::move(future);
}

}  // namespace exec_sandbox
