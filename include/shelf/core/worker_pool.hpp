// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace shelf::core {

// Fixed set of worker threads draining a FIFO job queue.
// The pool only grows; shrinking the concurrency is an admission decision.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t threads = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Add threads until at least `threads` run
    void resize(std::size_t threads);

    // False once the pool is stopped
    bool submit(Job job);

    // Drop queued jobs and join the threads; running jobs finish first
    void stop();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t pending() const;

private:
    void worker_loop(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    std::vector<std::jthread> threads_;
    bool stopped_{false};
};

} // namespace shelf::core
