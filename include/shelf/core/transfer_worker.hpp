// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/config.hpp>
#include <shelf/core/error.hpp>
#include <shelf/core/http_transport.hpp>
#include <shelf/core/task.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>

namespace shelf::core {

struct TransferConfig {
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t checkpoint_every_chunks{CHECKPOINT_EVERY_CHUNKS};
    std::chrono::milliseconds checkpoint_interval{CHECKPOINT_INTERVAL};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
};

struct TransferProgress {
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> expected_size;
    std::uint64_t speed_bps{0};
    std::optional<std::uint64_t> eta_seconds;
};

// Receives updates from a running transfer, on the worker's thread
class TransferListener {
public:
    virtual ~TransferListener() = default;

    virtual void on_progress(const TaskId& id, const TransferProgress& progress) = 0;

    // Every byte below `bytes_downloaded` is on stable storage
    virtual void on_checkpoint(const TaskId& id,
                               std::uint64_t bytes_downloaded,
                               std::optional<std::uint64_t> expected_size) = 0;
};

struct TransferResult {
    std::error_code error;  // empty when the whole body is on disk
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> expected_size;
    std::optional<std::chrono::seconds> retry_after;
};

// Streams one task's body into its destination file, resuming at the
// persisted offset. Stateless between runs; one instance may serve many tasks.
class TransferWorker {
public:
    TransferWorker(HttpTransport& transport, TransferListener& listener,
                   TransferConfig config = {}) noexcept;

    // Run until the body is complete, an error occurs, or `stop` is requested
    // (DownloadErrc::cancelled). The file is synced and the offset
    // checkpointed before returning in every case where the file was opened.
    [[nodiscard]] TransferResult run(const DownloadTask& task, std::stop_token stop);

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    HttpTransport& transport_;
    TransferListener& listener_;
    TransferConfig config_;
};

} // namespace shelf::core
