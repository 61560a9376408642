// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <shelf/core/worker_pool.hpp>
#include <atomic>
#include <chrono>
#include <latch>
#include <stdexcept>

using namespace shelf::core;
using namespace std::chrono_literals;

TEST_CASE("WorkerPool runs submitted jobs", "[pool]") {
    WorkerPool pool(4);
    CHECK(pool.size() == 4);

    std::atomic<int> done{0};
    std::latch finished(100);
    for (int i = 0; i < 100; ++i) {
        REQUIRE(pool.submit([&] {
            ++done;
            finished.count_down();
        }));
    }
    finished.wait();
    CHECK(done.load() == 100);
}

TEST_CASE("WorkerPool runs jobs in parallel", "[pool]") {
    WorkerPool pool(3);
    std::latch all_started(3);
    std::latch all_done(3);

    for (int i = 0; i < 3; ++i) {
        pool.submit([&] {
            // Only returns once all three run at the same time
            all_started.arrive_and_wait();
            all_done.count_down();
        });
    }
    all_done.wait();
    SUCCEED();
}

TEST_CASE("WorkerPool grows but never shrinks", "[pool]") {
    WorkerPool pool(2);
    pool.resize(5);
    CHECK(pool.size() == 5);
    pool.resize(1);
    CHECK(pool.size() == 5);
}

TEST_CASE("A throwing job does not kill its worker", "[pool]") {
    WorkerPool pool(1);
    std::latch finished(1);

    pool.submit([] { throw std::runtime_error("job failure"); });
    pool.submit([&] { finished.count_down(); });
    finished.wait();
    SUCCEED();
}

TEST_CASE("Stopped pool rejects jobs", "[pool]") {
    WorkerPool pool(2);
    pool.stop();
    CHECK_FALSE(pool.submit([] {}));
    CHECK(pool.size() == 0);
}
