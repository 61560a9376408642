// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace shelf::core {

using TaskId = std::string;
using Clock = std::chrono::system_clock;

// Task state machine
enum class TaskState : std::uint8_t {
    queued,     // Waiting for a worker slot
    active,     // Held by a transfer worker
    paused,     // Stopped by the user, resumable
    verifying,  // Body written, integrity check running
    completed,  // Verified
    failed,     // Gave up, waits for an explicit retry
    cancelled   // Stopped by the user, waits for an explicit retry
};

[[nodiscard]] std::string_view to_string(TaskState state) noexcept;
[[nodiscard]] std::optional<TaskState> parse_task_state(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    return state == TaskState::completed
        || state == TaskState::failed
        || state == TaskState::cancelled;
}

// Expected digest of the finished file, e.g. {"sha256", "9f86d0..."}
struct Checksum {
    std::string algorithm;
    std::string hex;

    bool operator==(const Checksum&) const = default;
};

// One file to download
struct DownloadTask {
    TaskId id;
    std::string source_id;
    std::string filename;
    std::string source_url;
    std::string destination_path;
    std::optional<std::uint64_t> expected_size;
    std::optional<Checksum> expected_checksum;

    std::uint64_t bytes_downloaded{0};
    TaskState state{TaskState::queued};
    std::uint32_t retry_count{0};
    std::string last_error;

    Clock::time_point created_at;
    Clock::time_point updated_at;

    // Admission order; lower goes first
    std::int64_t queue_seq{0};
    // Bumped on every mutation, orders record writes
    std::uint64_t revision{0};

    // Derived while active, never persisted
    std::uint64_t speed_bps{0};
    std::optional<std::uint64_t> eta_seconds;

    [[nodiscard]] double fraction() const noexcept {
        if (!expected_size || *expected_size == 0) return 0.0;
        return static_cast<double>(bytes_downloaded) / static_cast<double>(*expected_size);
    }
};

// Time remaining at the given speed, empty when it cannot be estimated
[[nodiscard]] std::optional<std::uint64_t> estimate_eta(std::optional<std::uint64_t> expected_size,
                                                        std::uint64_t bytes_downloaded,
                                                        std::uint64_t speed_bps) noexcept;

// Human readable size, e.g. "1.5 GB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

} // namespace shelf::core
