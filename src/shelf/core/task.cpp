// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/task.hpp>
#include <array>
#include <cstdio>

namespace shelf::core {

std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::queued:    return "queued";
        case TaskState::active:    return "active";
        case TaskState::paused:    return "paused";
        case TaskState::verifying: return "verifying";
        case TaskState::completed: return "completed";
        case TaskState::failed:    return "failed";
        case TaskState::cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<TaskState> parse_task_state(std::string_view text) noexcept {
    constexpr std::array states{
        TaskState::queued, TaskState::active, TaskState::paused, TaskState::verifying,
        TaskState::completed, TaskState::failed, TaskState::cancelled,
    };
    for (auto state : states) {
        if (to_string(state) == text) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> estimate_eta(std::optional<std::uint64_t> expected_size,
                                          std::uint64_t bytes_downloaded,
                                          std::uint64_t speed_bps) noexcept {
    if (!expected_size || speed_bps == 0) {
        return std::nullopt;
    }
    if (bytes_downloaded >= *expected_size) {
        return 0;
    }
    return (*expected_size - bytes_downloaded) / speed_bps;
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array units{"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

} // namespace shelf::core
