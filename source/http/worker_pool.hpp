#ifndef AIMCPS_WORKER_POOL_HPP
#define AIMCPS_WORKER_POOL_HPP

// Thread pool for tool calls. Starts with min_threads and adds a thread
// whenever a job is queued while every existing thread is busy, up to
// max_threads, so that one tool blocked on disk or a child process does not
// hold back the others. Threads are kept until stop().

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace http_server {

class WorkerPool {
public:
    WorkerPool(int min_threads, int max_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Queue a job. Returns false once stop() has been called.
    bool submit(std::function<void()> job);

    // Finish queued jobs, then join all threads. Safe to call twice.
    void stop();

    std::size_t thread_count();

private:
    void run();

    std::size_t max_threads_;

    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::function<void()>> jobs_;
    std::vector<std::thread> threads_;
    std::size_t idle_threads_ = 0;
    bool stopping_ = false;
};

} // namespace http_server

#endif // AIMCPS_WORKER_POOL_HPP
