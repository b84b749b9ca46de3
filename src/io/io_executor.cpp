// io_executor.cpp - worker pool that runs provider syscalls off the caller's thread.

#include "io/io_executor.hpp"

#include "util/logger.hpp"

#include <stdexcept>

namespace blockflow {

IoExecutor::IoExecutor(std::size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
    LogDebug("io executor started with %zu thread(s)", threads);
}

IoExecutor::~IoExecutor() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void IoExecutor::Post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) {
            throw std::runtime_error("io executor is shutting down");
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void IoExecutor::WorkerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        // packaged_task stores exceptions in the future, so jobs do not throw here.
        job();
    }
}

} // namespace blockflow
