// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <deque>

namespace shelf::core {

// Transfer speed over a sliding time window
class SpeedMeter {
public:
    using clock = std::chrono::steady_clock;

    explicit SpeedMeter(std::chrono::milliseconds window = SPEED_WINDOW) noexcept;

    // Record `bytes` received at `now`
    void add(std::uint64_t bytes, clock::time_point now = clock::now());

    // Bytes per second over the window ending at `now`
    [[nodiscard]] std::uint64_t bytes_per_second(clock::time_point now = clock::now()) const noexcept;

    void reset() noexcept;

private:
    struct Sample {
        clock::time_point at;
        std::uint64_t bytes;
    };

    void expire(clock::time_point now);

    std::chrono::milliseconds window_;
    std::deque<Sample> samples_;
    clock::time_point started_{};
    bool started_set_{false};
};

} // namespace shelf::core
