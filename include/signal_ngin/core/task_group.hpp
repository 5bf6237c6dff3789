// include/signal_ngin/core/task_group.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/worker_pool.hpp"

namespace signal_ngin {

/**
 * @brief Shared cancellation flag handed to a running task
 *
 * Copies observe the same flag. Tasks poll is_cancelled() between steps.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const {
        flag_->store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

template <typename T>
using SettledTask = std::function<Result<T>(const CancellationToken&)>;

/**
 * @brief Run tasks concurrently and collect one result per task
 *
 * A failing, throwing or late task never affects its siblings. Tasks still
 * running at the deadline are cancelled and reported as TIMEOUT_ERROR; the
 * returned vector is ordered like the input.
 *
 * @param pool Pool executing the tasks
 * @param tasks Tasks to run
 * @param timeout Shared deadline for the whole batch
 * @param component Component name for error results
 */
template <typename T>
std::vector<Result<T>> gather_settled(WorkerPool& pool, std::vector<SettledTask<T>> tasks,
                                      std::chrono::milliseconds timeout,
                                      const std::string& component = "TaskGroup") {
    std::vector<CancellationToken> tokens(tasks.size());
    std::vector<std::future<Result<T>>> futures;
    std::vector<std::unique_ptr<SignalError>> submit_errors(tasks.size());
    futures.reserve(tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i) {
        CancellationToken token = tokens[i];
        SettledTask<T> task = std::move(tasks[i]);
        try {
            futures.push_back(pool.submit([task, token]() -> Result<T> {
                if (token.is_cancelled()) {
                    return make_error<T>(ErrorCode::CANCELLED, "Task cancelled before start",
                                         "TaskGroup");
                }
                return task(token);
            }));
        } catch (const SignalError& e) {
            submit_errors[i] = std::make_unique<SignalError>(e);
            futures.emplace_back();
        }
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<Result<T>> results;
    results.reserve(futures.size());

    for (size_t i = 0; i < futures.size(); ++i) {
        if (submit_errors[i]) {
            results.push_back(Result<T>(std::move(submit_errors[i])));
            continue;
        }

        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            tokens[i].cancel();
            WARN("Task " << i << " did not finish within " << timeout.count() << "ms");
            results.push_back(make_error<T>(ErrorCode::TIMEOUT_ERROR,
                                            "Task did not finish within " +
                                                std::to_string(timeout.count()) + "ms",
                                            component));
            continue;
        }

        try {
            results.push_back(futures[i].get());
        } catch (const SignalError& e) {
            results.push_back(make_error<T>(e.code(), e.what(), component));
        } catch (const std::exception& e) {
            results.push_back(make_error<T>(ErrorCode::UNKNOWN_ERROR,
                                            std::string("Task threw: ") + e.what(), component));
        }
    }

    return results;
}

}  // namespace signal_ngin
