// include/signal_ngin/core/worker_pool.hpp
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Fixed-size pool of worker threads draining a FIFO queue
 */
class WorkerPool {
public:
    /**
     * @brief Constructor
     * @param name Name used in log messages
     * @param thread_count Number of worker threads, at least one
     */
    WorkerPool(std::string name, size_t thread_count);

    /**
     * @brief Stops the pool, running the jobs already queued
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a callable for execution
     * @return Future for the callable's return value
     * @throws SignalError (NOT_INITIALIZED) after shutdown
     */
    template <typename Func>
    auto submit(Func func) -> std::future<decltype(func())> {
        using ReturnType = decltype(func());
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::move(func));
        std::future<ReturnType> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw SignalError(ErrorCode::NOT_INITIALIZED,
                                  "Worker pool " + name_ + " is shut down", "WorkerPool");
            }
            jobs_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    /**
     * @brief Stop accepting work, finish queued jobs and join all threads
     */
    void shutdown();

    size_t thread_count() const {
        return workers_.size();
    }

    size_t pending_jobs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    const std::string& name() const {
        return name_;
    }

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

}  // namespace signal_ngin
