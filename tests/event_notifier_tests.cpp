// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <shelf/core/event_notifier.hpp>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace shelf::core;

namespace {

Event progress(const std::string& id, std::uint64_t bytes) {
    return ProgressEvent{id, bytes, std::nullopt, 0, std::nullopt};
}

} // namespace

TEST_CASE("EventNotifier delivers in publish order", "[events]") {
    EventNotifier notifier;
    std::mutex mutex;
    std::vector<std::uint64_t> seen;

    notifier.subscribe([&](const Event& event) {
        if (const auto* p = std::get_if<ProgressEvent>(&event)) {
            std::lock_guard lock(mutex);
            seen.push_back(p->bytes_downloaded);
        }
    });

    for (std::uint64_t i = 0; i < 1000; ++i) {
        notifier.publish(progress("t", i));
    }
    notifier.drain();

    std::lock_guard lock(mutex);
    REQUIRE(seen.size() == 1000);
    for (std::uint64_t i = 0; i < seen.size(); ++i) {
        CHECK(seen[i] == i);
    }
}

TEST_CASE("EventNotifier fans out to every observer", "[events]") {
    EventNotifier notifier;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    notifier.subscribe([&](const Event&) { ++first; });
    auto id = notifier.subscribe([&](const Event&) { ++second; });

    notifier.publish(TaskRemoved{"a"});
    notifier.drain();
    CHECK(first.load() == 1);
    CHECK(second.load() == 1);

    SECTION("Unsubscribed observers stop receiving") {
        notifier.unsubscribe(id);
        notifier.publish(TaskRemoved{"b"});
        notifier.drain();
        CHECK(first.load() == 2);
        CHECK(second.load() == 1);
    }
}

TEST_CASE("A throwing observer does not stop delivery", "[events]") {
    EventNotifier notifier;
    std::atomic<int> delivered{0};

    notifier.subscribe([](const Event&) { throw std::runtime_error("observer failure"); });
    notifier.subscribe([&](const Event&) { ++delivered; });

    notifier.publish(TaskRemoved{"a"});
    notifier.publish(TaskRemoved{"b"});
    notifier.drain();
    CHECK(delivered.load() == 2);
}

TEST_CASE("Publishing never waits for a slow observer", "[events]") {
    EventNotifier notifier;
    std::atomic<bool> release{false};
    std::atomic<int> delivered{0};

    notifier.subscribe([&](const Event&) {
        while (!release) {
            std::this_thread::yield();
        }
        ++delivered;
    });

    for (int i = 0; i < 100; ++i) {
        notifier.publish(TaskRemoved{"x"});
    }
    CHECK(delivered.load() == 0);

    release = true;
    notifier.drain();
    CHECK(delivered.load() == 100);
}

TEST_CASE("stop delivers what is queued", "[events]") {
    std::atomic<int> delivered{0};
    {
        EventNotifier notifier;
        notifier.subscribe([&](const Event&) { ++delivered; });
        for (int i = 0; i < 50; ++i) {
            notifier.publish(TaskRemoved{"x"});
        }
        notifier.stop();
        CHECK(delivered.load() == 50);

        // drain after stop returns immediately
        notifier.drain();
    }
    CHECK(delivered.load() == 50);
}

TEST_CASE("event_task_id", "[events]") {
    DownloadTask task;
    task.id = "abc";
    CHECK(event_task_id(TaskAdded{task}) == "abc");
    CHECK(event_task_id(StateChanged{"def", TaskState::queued, TaskState::active, {}}) == "def");
    CHECK(event_task_id(TaskRemoved{"ghi"}) == "ghi");
}
