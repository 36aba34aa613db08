/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by ParallelExecutor.
 */

#ifndef SQUISHER_THREAD_POOL_HPP
#define SQUISHER_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size thread pool backed by std::jthread.
 *
 * @details The destructor closes the queue, lets the workers drain what
 * is left and joins them. A task that throws has its exception stored in
 * the returned future.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Lets queued tasks finish, then joins the workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue @p f for execution on a worker.
     * @return A future for the task's result.
     * @throws std::runtime_error if the pool is shutting down.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
        using return_type = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        auto future = task->get_future();
        {
            std::lock_guard lock(queue_mutex_);
            if (closed_) throw std::runtime_error("enqueue on a closed ThreadPool");
            ++pending_;
            tasks_.emplace([task] { (*task)(); });
        }
        work_cv_.notify_one();
        return future;
    }

    /**
     * @brief Blocks until every enqueued task has finished.
     */
    void wait_idle();

private:
    using Task = std::function<void()>;

    void worker_loop();

    /// Blocks for the next task; empty once the pool is closed and drained.
    std::optional<Task> next_task();

    void task_done();

    std::mutex queue_mutex_;            ///< Protects tasks_, closed_ and pending_
    std::condition_variable work_cv_;   ///< New task or close
    std::condition_variable idle_cv_;   ///< pending_ reached zero
    std::queue<Task> tasks_;
    bool closed_{false};
    std::size_t pending_{0};            ///< Enqueued or running
    std::vector<std::jthread> workers_; ///< Declared last so they join first
};

#endif // SQUISHER_THREAD_POOL_HPP
