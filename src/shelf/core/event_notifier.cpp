// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/event_notifier.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <type_traits>

namespace shelf::core {

const TaskId& event_task_id(const Event& event) noexcept {
    return std::visit([](const auto& e) -> const TaskId& {
        if constexpr (std::is_same_v<std::decay_t<decltype(e)>, TaskAdded>) {
            return e.task.id;
        } else {
            return e.id;
        }
    }, event);
}

//=============================================================================
// EventNotifier
//=============================================================================

EventNotifier::EventNotifier()
    : thread_([this](std::stop_token stop) { dispatch_loop(stop); }) {}

EventNotifier::~EventNotifier() {
    stop();
}

EventNotifier::SubscriptionId EventNotifier::subscribe(Observer observer) {
    std::lock_guard lock(observers_mutex_);
    auto id = next_id_++;
    observers_.emplace_back(id, std::make_shared<Observer>(std::move(observer)));
    return id;
}

void EventNotifier::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(observers_mutex_);
    std::erase_if(observers_, [id](const auto& entry) { return entry.first == id; });
}

void EventNotifier::publish(Event event) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(event));
        ++published_;
    }
    queue_cv_.notify_one();
}

void EventNotifier::drain() {
    if (std::this_thread::get_id() == thread_.get_id()) {
        return;
    }
    std::unique_lock lock(mutex_);
    auto target = published_;
    delivered_cv_.wait(lock, [&] { return delivered_ >= target || stopped_; });
}

void EventNotifier::stop() {
    if (!thread_.joinable() || std::this_thread::get_id() == thread_.get_id()) {
        return;
    }
    thread_.request_stop();
    queue_cv_.notify_all();
    thread_.join();
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
    }
    delivered_cv_.notify_all();
}

void EventNotifier::dispatch_loop(std::stop_token stop) {
    while (true) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                // Stop requested and nothing left to deliver
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }

        std::vector<std::shared_ptr<Observer>> observers;
        {
            std::lock_guard lock(observers_mutex_);
            observers.reserve(observers_.size());
            for (const auto& entry : observers_) {
                observers.push_back(entry.second);
            }
        }

        for (const auto& observer : observers) {
            try {
                (*observer)(event);
            } catch (const std::exception& e) {
                spdlog::error("event observer threw: {}", e.what());
            }
        }

        {
            std::lock_guard lock(mutex_);
            ++delivered_;
        }
        delivered_cv_.notify_all();
    }
}

} // namespace shelf::core
