#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        closed_ = true;
    }
    work_cv_.notify_all();
    // the jthreads join here, after the queue has drained
}

void ThreadPool::worker_loop() {
    while (auto task = next_task()) {
        try {
            (*task)();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(), "thread_pool");
        }
        task_done();
    }
}

std::optional<ThreadPool::Task> ThreadPool::next_task() {
    std::unique_lock lock(queue_mutex_);
    work_cv_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
    if (tasks_.empty()) {
        return std::nullopt;
    }
    Task task = std::move(tasks_.front());
    tasks_.pop();
    return task;
}

void ThreadPool::task_done() {
    {
        std::lock_guard lock(queue_mutex_);
        --pending_;
    }
    idle_cv_.notify_all();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}
