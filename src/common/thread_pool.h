#pragma once

/// @file thread_pool.h
/// @brief Worker pool used for provider calls and batch screening

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace guardian {

/// @brief Fixed-size pool of named worker threads
///
/// Futures returned by Submit() come from std::packaged_task, so dropping a
/// future never blocks the caller. The engine relies on this to abandon a
/// provider call whose timeout expired; the worker finishes the call and
/// discards the result.
class ThreadPool {
public:
    struct Stats {
        size_t queued = 0;
        size_t running = 0;
        size_t completed = 0;
    };

    /// @param num_threads Worker count; 0 picks hardware concurrency
    /// @param name Used in log lines
    explicit ThreadPool(size_t num_threads = 0, std::string name = "guardian-pool");

    /// @brief Drains queued tasks and joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// @brief Queue a callable taking no arguments
    /// @throws std::runtime_error once Shutdown() has been called
    template <typename F>
    std::future<std::invoke_result_t<F>> Submit(F&& fn);

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    Stats GetStats() const;

    /// @brief Reject new work, run what is queued, join the workers.
    ///        Safe to call more than once.
    void Shutdown();

    bool IsStopped() const;

private:
    using Task = std::function<void()>;

    void Enqueue(Task task);

    /// Blocks until a task is available; nullopt once stopped and drained
    std::optional<Task> NextTask();

    void WorkerLoop();

    const std::string name_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    size_t running_ = 0;
    size_t completed_ = 0;
};

template <typename F>
std::future<std::invoke_result_t<F>> ThreadPool::Submit(F&& fn) {
    using Result = std::invoke_result_t<F>;

    // std::function needs a copyable target, hence the shared_ptr
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
}

}  // namespace guardian
