#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace texharvest {

ThreadPool::ThreadPool(unsigned threads, std::string name) : name_(std::move(name)) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, st, [this] {
                        return stop_ || !tasks_.empty();
                    });
                    if ((stop_ && tasks_.empty()) || st.stop_requested())
                        return;
                    if (tasks_.empty())
                        continue;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                struct PendingGuard {
                    size_t &pending;
                    std::mutex &mtx;
                    ~PendingGuard() {
                        std::lock_guard lock(mtx);
                        if (pending > 0) --pending;
                    }
                } guard{pending_, queue_mutex_};
                // packaged_task stores exceptions in the future; anything
                // reaching here escaped the wrapper itself
                try {
                    task(st);
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error,
                                std::string("Unhandled exception in thread pool: ") + e.what(), name_);
                }
            }
        });
    }
    Logger::log(LogLevel::Debug, "Started " + std::to_string(threads) + " worker(s)", name_);
}

void ThreadPool::request_stop() {
    size_t dropped = 0;
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
        while (!tasks_.empty()) {
            tasks_.pop();
            ++dropped;
            if (pending_ > 0) {
                pending_--;
            }
        }
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    if (dropped > 0) {
        Logger::log(LogLevel::Debug, "Dropped " + std::to_string(dropped) + " queued task(s)", name_);
    }
}

size_t ThreadPool::pending() const {
    std::lock_guard lock(queue_mutex_);
    return pending_;
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

} // namespace texharvest
