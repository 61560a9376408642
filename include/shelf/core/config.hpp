// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>

namespace shelf::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 3;

constexpr std::size_t DEFAULT_CHUNK_SIZE = 256 * 1024;              // 256 KB
constexpr std::uint32_t CHECKPOINT_EVERY_CHUNKS = 16;               // 4 MB at the default chunk size
constexpr std::chrono::milliseconds CHECKPOINT_INTERVAL{2000};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};
constexpr std::chrono::milliseconds SPEED_WINDOW{5000};

constexpr std::uint32_t DEFAULT_MAX_RETRIES = 4;
constexpr std::chrono::milliseconds RETRY_BASE_DELAY{1000};
constexpr std::chrono::milliseconds RETRY_MAX_DELAY{60'000};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;                     // below 1 B/s for this long aborts
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t VERIFY_BUFFER_SIZE = 1024 * 1024;             // 1 MB

} // namespace shelf::core
