/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool that runs split job workers.
 */

#ifndef TOCSPLIT_THREAD_POOL_HPP
#define TOCSPLIT_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @brief A simple fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread instances and tasks receive the
 * worker's std::stop_token. Destroying the pool lets every queued task
 * run to completion before the workers are joined.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads Number of worker threads; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue, then joins all workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * The task must be a callable that accepts a `std::stop_token`. It may
     * be move-only.
     *
     * @return A std::future for the task's result.
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
     * @brief Blocks the calling thread until all pending tasks are complete.
     */
    void wait_idle();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::condition_variable idle_cv_;       ///< Notifies wait_idle() when pending_ is zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::size_t pending_{0};                ///< Number of tasks enqueued or running
    std::vector<std::jthread> workers_;
};

#endif // TOCSPLIT_THREAD_POOL_HPP
