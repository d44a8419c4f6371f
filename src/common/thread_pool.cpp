/// @file thread_pool.cpp
/// @brief ThreadPool worker management

#include "common/thread_pool.h"

#include "common/logging.h"

namespace guardian {

namespace {

constexpr size_t kFallbackThreads = 4;

}  // namespace

ThreadPool::ThreadPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
    }
    if (num_threads == 0) {
        num_threads = kFallbackThreads;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
    GUARDIAN_LOG_DEBUG("{}: started {} workers", name_, num_threads);
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error(name_ + " is shut down");
        }
        queue_.push_back(std::move(task));
    }
    wakeup_.notify_one();
}

std::optional<ThreadPool::Task> ThreadPool::NextTask() {
    std::unique_lock<std::mutex> lock(mutex_);
    wakeup_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Task task = std::move(queue_.front());
    queue_.pop_front();
    ++running_;
    return task;
}

void ThreadPool::WorkerLoop() {
    while (auto task = NextTask()) {
        // packaged_task stores any exception in its future
        (*task)();

        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
        ++completed_;
    }
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    wakeup_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    const Stats stats = GetStats();
    GUARDIAN_LOG_DEBUG("{}: stopped after {} tasks", name_, stats.completed);
}

bool ThreadPool::IsStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + running_;
}

ThreadPool::Stats ThreadPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{queue_.size(), running_, completed_};
}

}  // namespace guardian
