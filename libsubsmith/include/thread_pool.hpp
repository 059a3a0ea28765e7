//
// Created by Giuseppe Francione on 03/10/26.
//

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool backing the job scheduler.
 *
 * Each worker runs one task at a time. The pool size is the only
 * concurrency control of a batch: the JobScheduler never hands the
 * pool more tasks than it has workers.
 */

#ifndef SUBSMITH_THREAD_POOL_HPP
#define SUBSMITH_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

/**
 * @brief A fixed-size thread pool built on std::jthread.
 *
 * @details Tasks receive the worker's std::stop_token, which is signalled
 * when the pool is destroyed. Tasks already blocked in an external call
 * (e.g. waiting on a child process) are not interrupted.
 */
class ThreadPool {
public:
    /**
     * @brief Starts @p threads workers (at least one).
     */
    explicit ThreadPool(unsigned threads);

    /**
     * @brief Stops accepting work and joins all workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task taking a `std::stop_token`.
     * @return A future for the task result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks until no task is queued or running.
     */
    void wait_idle();

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ drops to zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    size_t pending_{0};                     ///< Tasks enqueued or running
    std::vector<std::jthread> workers_;
};

#endif // SUBSMITH_THREAD_POOL_HPP
