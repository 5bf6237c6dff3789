// src/core/worker_pool.cpp

#include "signal_ngin/core/worker_pool.hpp"
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

WorkerPool::WorkerPool(std::string name, size_t thread_count) : name_(std::move(name)) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    DEBUG("Worker pool " << name_ << " started with " << thread_count << " threads");
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    DEBUG("Worker pool " << name_ << " stopped");
}

void WorkerPool::worker_loop() {
    Logger::register_component(name_);

    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        // packaged_task stores exceptions in the future
        job();
    }
}

}  // namespace signal_ngin
