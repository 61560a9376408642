// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/speed_meter.hpp>
#include <algorithm>

namespace shelf::core {

namespace {

// Avoid spikes right after the first sample
constexpr std::chrono::milliseconds MIN_SPAN{100};

} // namespace

SpeedMeter::SpeedMeter(std::chrono::milliseconds window) noexcept
    : window_(window) {}

void SpeedMeter::add(std::uint64_t bytes, clock::time_point now) {
    if (!started_set_) {
        started_ = now;
        started_set_ = true;
    }
    samples_.push_back({now, bytes});
    expire(now);
}

std::uint64_t SpeedMeter::bytes_per_second(clock::time_point now) const noexcept {
    if (!started_set_ || samples_.empty()) {
        return 0;
    }

    // Span covered by the window, shorter while the transfer is young
    auto window_start = now - window_;
    auto span_start = std::max(window_start, started_);
    auto span = std::chrono::duration_cast<std::chrono::milliseconds>(now - span_start);
    span = std::max(span, MIN_SPAN);

    std::uint64_t bytes = 0;
    for (const auto& s : samples_) {
        if (s.at >= window_start) {
            bytes += s.bytes;
        }
    }

    return static_cast<std::uint64_t>(static_cast<double>(bytes) * 1000.0
                                      / static_cast<double>(span.count()));
}

void SpeedMeter::reset() noexcept {
    samples_.clear();
    started_set_ = false;
}

void SpeedMeter::expire(clock::time_point now) {
    auto window_start = now - window_;
    while (!samples_.empty() && samples_.front().at < window_start) {
        samples_.pop_front();
    }
}

} // namespace shelf::core
