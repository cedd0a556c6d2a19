#include "http/worker_pool.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace http_server {

WorkerPool::WorkerPool(int min_threads, int max_threads) {
    min_threads = std::max(min_threads, 1);
    max_threads_ = static_cast<std::size_t>(std::max(max_threads, min_threads));

    std::lock_guard<std::mutex> lock(mutex_);
    threads_.reserve(static_cast<std::size_t>(min_threads));
    for (int index = 0; index < min_threads; ++index) {
        threads_.emplace_back(&WorkerPool::run, this);
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        jobs_.push_back(std::move(job));
        if (jobs_.size() > idle_threads_ && threads_.size() < max_threads_) {
            threads_.emplace_back(&WorkerPool::run, this);
            debug_log::log("Worker pool grew to " + std::to_string(threads_.size()) + " threads");
        }
    }
    condition_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    condition_.notify_all();
    // No thread is added once stopping_ is set.
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

std::size_t WorkerPool::thread_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++idle_threads_;
            condition_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            --idle_threads_;
            if (jobs_.empty()) {
                return; // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception &error) {
            debug_log::warn(std::string("worker job failed: ") + error.what());
        }
    }
}

} // namespace http_server
