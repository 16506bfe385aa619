/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool with cooperative cancellation.
 *
 * The orchestrator owns two of these: a scheduler pool that runs one task
 * per pipeline item, and a bounded worker pool that runs the blocking
 * stages (archive parsing, subprocess execution) on behalf of items.
 */

#ifndef TEXHARVEST_THREAD_POOL_HPP
#define TEXHARVEST_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace texharvest {

/**
 * @brief A simple fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread, so destruction requests stop and joins.
 * Every task receives the worker's std::stop_token; request_stop() both
 * drops queued tasks (their futures report std::future_error) and signals
 * the tokens of running ones.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the pool and starts worker threads.
     * @param threads Number of worker threads (0 is treated as 1).
     * @param name Name used in log messages.
     */
    explicit ThreadPool(unsigned threads, std::string name = "pool");

    /**
     * @brief Requests stop and joins all worker threads.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task accepting a std::stop_token.
     * @return A future for the task's result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto fut = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool '" + name_ + "'");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return fut;
    }

    /**
     * @brief Drops queued tasks and signals running ones to stop.
     */
    void request_stop();

    /// @return Number of worker threads.
    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

    /// @return Tasks enqueued or running.
    [[nodiscard]] size_t pending() const;

private:
    std::string name_;                      ///< Used in log messages
    mutable std::mutex queue_mutex_;        ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    size_t pending_{0};
    std::vector<std::jthread> workers_;
};

} // namespace texharvest

#endif // TEXHARVEST_THREAD_POOL_HPP
