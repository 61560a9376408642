// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/worker_pool.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace shelf::core {

WorkerPool::WorkerPool(std::size_t threads) {
    resize(threads);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::resize(std::size_t threads) {
    std::lock_guard lock(mutex_);
    if (stopped_) {
        return;
    }
    while (threads_.size() < threads) {
        threads_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::stop() {
    std::vector<std::jthread> threads;
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        jobs_.clear();
        threads = std::move(threads_);
    }

    for (auto& t : threads) {
        t.request_stop();
    }
    cv_.notify_all();
    // jthread joins on destruction
    threads.clear();
}

std::size_t WorkerPool::size() const {
    std::lock_guard lock(mutex_);
    return threads_.size();
}

std::size_t WorkerPool::pending() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stop, [this] { return !jobs_.empty(); })) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("worker job threw: {}", e.what());
        }
    }
}

} // namespace shelf::core
