// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/task.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace shelf::core {

struct TaskAdded {
    DownloadTask task;
};

struct StateChanged {
    TaskId id;
    TaskState old_state;
    TaskState new_state;
    std::string error;  // set when entering failed, or queued for a retry
};

struct ProgressEvent {
    TaskId id;
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> expected_size;
    std::uint64_t speed_bps{0};
    std::optional<std::uint64_t> eta_seconds;
};

struct TaskRemoved {
    TaskId id;
};

using Event = std::variant<TaskAdded, StateChanged, ProgressEvent, TaskRemoved>;

[[nodiscard]] const TaskId& event_task_id(const Event& event) noexcept;

// Ordered fan-out of events. Observers run one at a time on a dedicated
// dispatch thread, in publish order, never under the publisher's locks.
class EventNotifier {
public:
    using Observer = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    EventNotifier();
    ~EventNotifier();

    // Non-copyable, non-movable
    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    SubscriptionId subscribe(Observer observer);

    // An event already being delivered may still reach the observer
    void unsubscribe(SubscriptionId id);

    // Queue for delivery; never blocks on observers
    void publish(Event event);

    // Block until every event published before the call was delivered.
    // Returns immediately on the dispatch thread.
    void drain();

    // Deliver what is queued, then stop the dispatch thread
    void stop();

private:
    void dispatch_loop(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable delivered_cv_;
    std::deque<Event> queue_;
    std::uint64_t published_{0};
    std::uint64_t delivered_{0};
    bool stopped_{false};

    std::mutex observers_mutex_;
    std::vector<std::pair<SubscriptionId, std::shared_ptr<Observer>>> observers_;
    SubscriptionId next_id_{1};

    std::jthread thread_;
};

} // namespace shelf::core
