// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/transfer_worker.hpp>
#include <shelf/core/speed_meter.hpp>
#include <shelf/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <utility>

namespace shelf::core {

namespace {

using steady = std::chrono::steady_clock;

// One fetch attempt's view of the destination file.
// Bytes are staged in a ChunkBuffer and appended chunk by chunk.
class ChunkedSink final : public FetchHandler {
public:
    ChunkedSink(const DownloadTask& task, disk::FileWriter& writer,
                TransferListener& listener, const TransferConfig& config,
                std::stop_token stop, std::uint64_t offset,
                std::optional<std::uint64_t> expected_size)
        : task_(task)
        , writer_(writer)
        , listener_(listener)
        , config_(config)
        , stop_(std::move(stop))
        , buffer_(std::max<std::size_t>(config.chunk_size, 1))
        , offset_(offset)
        , expected_(expected_size)
        , last_checkpoint_(steady::now())
        , last_progress_(steady::now()) {}

    bool on_head(const ResponseHead& head) override {
        status_ = head.status_code;

        if (status_ == 206) {
            auto range = head.content_range();
            if (range && range->first != offset_) {
                // Answered a different range than asked for
                restart_unranged_ = true;
                return false;
            }
            if (!expected_ && range && range->total) {
                expected_ = range->total;
            }
            return true;
        }

        if (status_ == 200) {
            if (offset_ > 0) {
                spdlog::warn("task {}: server ignored range at offset {}, restarting from 0",
                             task_.id, offset_);
                if (auto ec = restart_at_zero()) {
                    error_ = ec;
                    return false;
                }
            }
            if (!expected_) {
                expected_ = head.content_length();
            }
            return true;
        }

        if (status_ == 416 && offset_ > 0) {
            restart_unranged_ = true;
            return false;
        }

        error_ = status_to_error_code(status_);
        if (!error_) {
            // Other 2xx carry no usable body
            error_ = make_error_code(DownloadErrc::http_client_error);
        }
        if (status_ == 429 || status_ == 503) {
            if (auto seconds = head.retry_after_seconds()) {
                retry_after_ = std::chrono::seconds(*seconds);
            }
        }
        return false;
    }

    bool on_body(std::span<const std::byte> data) override {
        if (error_) {
            return false;
        }

        const std::byte* ptr = data.data();
        std::size_t remaining = data.size();

        // Never write past a known size
        if (expected_) {
            std::uint64_t room = *expected_ - std::min(*expected_, offset_ + buffer_.size());
            if (remaining > room) {
                remaining = static_cast<std::size_t>(room);
                overflow_ = true;
            }
        }

        while (remaining > 0) {
            std::size_t taken = buffer_.fill(ptr, remaining);
            ptr += taken;
            remaining -= taken;

            if (buffer_.full()) {
                if (auto ec = flush_chunk()) {
                    error_ = ec;
                    return false;
                }
                if (stop_.stop_requested()) {
                    stopped_ = true;
                    return false;
                }
            }
        }

        if (overflow_) {
            error_ = make_error_code(DownloadErrc::size_mismatch);
            return false;
        }
        return true;
    }

    // Append what is still staged and record the offset durably
    std::error_code finish() {
        if (!buffer_.empty() && !is_disk_error(error_)) {
            if (auto ec = flush_chunk()) {
                return ec;
            }
        }
        return checkpoint();
    }

    std::error_code restart_at_zero() {
        buffer_.reset();
        if (auto ec = writer_.truncate(0)) {
            return ec;
        }
        offset_ = 0;
        meter_.reset();
        return checkpoint();
    }

    void publish_progress() {
        auto speed = meter_.bytes_per_second();
        listener_.on_progress(task_.id, {offset_, expected_, speed,
                                         estimate_eta(expected_, offset_, speed)});
        last_progress_ = steady::now();
    }

    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::optional<std::uint64_t> expected_size() const noexcept { return expected_; }
    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }
    [[nodiscard]] bool stopped() const noexcept { return stopped_; }
    [[nodiscard]] bool restart_unranged() const noexcept { return restart_unranged_; }
    [[nodiscard]] std::optional<std::chrono::seconds> retry_after() const noexcept { return retry_after_; }

private:
    static bool is_disk_error(const std::error_code& ec) noexcept {
        return classify(ec) == FailureKind::disk_io;
    }

    std::error_code flush_chunk() {
        if (auto ec = writer_.append(buffer_.data(), buffer_.size())) {
            return ec;
        }
        offset_ += buffer_.size();
        meter_.add(buffer_.size());
        buffer_.reset();
        ++chunks_since_checkpoint_;

        auto now = steady::now();
        if (now - last_progress_ >= config_.progress_interval) {
            publish_progress();
        }
        if (chunks_since_checkpoint_ >= config_.checkpoint_every_chunks ||
            now - last_checkpoint_ >= config_.checkpoint_interval) {
            return checkpoint();
        }
        return {};
    }

    std::error_code checkpoint() {
        if (auto ec = writer_.sync()) {
            return ec;
        }
        listener_.on_checkpoint(task_.id, offset_, expected_);
        chunks_since_checkpoint_ = 0;
        last_checkpoint_ = steady::now();
        return {};
    }

    const DownloadTask& task_;
    disk::FileWriter& writer_;
    TransferListener& listener_;
    const TransferConfig& config_;
    std::stop_token stop_;
    disk::ChunkBuffer buffer_;
    SpeedMeter meter_;

    std::uint64_t offset_;
    std::optional<std::uint64_t> expected_;
    std::int32_t status_{0};
    std::error_code error_;
    std::optional<std::chrono::seconds> retry_after_;
    bool stopped_{false};
    bool overflow_{false};
    bool restart_unranged_{false};

    std::uint32_t chunks_since_checkpoint_{0};
    steady::time_point last_checkpoint_;
    steady::time_point last_progress_;
};

} // namespace

//=============================================================================
// TransferWorker
//=============================================================================

TransferWorker::TransferWorker(HttpTransport& transport, TransferListener& listener,
                               TransferConfig config) noexcept
    : transport_(transport)
    , listener_(listener)
    , config_(config) {}

TransferResult TransferWorker::run(const DownloadTask& task, std::stop_token stop) {
    TransferResult result;
    result.bytes_downloaded = task.bytes_downloaded;
    result.expected_size = task.expected_size;

    if (task.destination_path.empty()) {
        result.error = make_error_code(DownloadErrc::empty_destination);
        return result;
    }
    if (stop.stop_requested()) {
        result.error = make_error_code(DownloadErrc::cancelled);
        return result;
    }

    std::error_code ec;
    auto parent = std::filesystem::path(task.destination_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("task {}: cannot create {}: {}", task.id, parent.string(), ec.message());
            result.error = ec;
            return result;
        }
    }

    disk::FileWriter writer;
    auto opened = writer.open(task.destination_path, task.bytes_downloaded);
    if (!opened) {
        spdlog::error("task {}: cannot open {}: {}", task.id, task.destination_path,
                      opened.error().message());
        result.error = opened.error();
        return result;
    }

    std::uint64_t offset = *opened;
    auto expected = task.expected_size;

    if (expected && offset > *expected) {
        if (auto trunc_ec = writer.truncate(0)) {
            result.error = trunc_ec;
            return result;
        }
        offset = 0;
    }

    // Nothing left to fetch
    if (expected && offset == *expected) {
        if (auto sync_ec = writer.sync()) {
            result.error = sync_ec;
            return result;
        }
        listener_.on_checkpoint(task.id, offset, expected);
        result.bytes_downloaded = offset;
        return result;
    }

    bool unranged = false;
    for (int attempt = 0; attempt < 2; ++attempt) {
        ChunkedSink sink(task, writer, listener_, config_, stop, offset, expected);

        FetchRequest request;
        request.url = task.source_url;
        if (!unranged && (offset > 0 || writer.existed())) {
            request.range_start = offset;
        }

        spdlog::debug("task {}: fetching {} from offset {}", task.id, request.url,
                      request.range_start.value_or(0));
        auto fetch_ec = transport_.fetch(request, sink, stop);

        if (sink.restart_unranged() && !unranged) {
            spdlog::warn("task {}: range at offset {} rejected, restarting from 0",
                         task.id, sink.offset());
            if (auto restart_ec = sink.restart_at_zero()) {
                result.error = restart_ec;
                result.bytes_downloaded = sink.offset();
                return result;
            }
            offset = 0;
            expected = sink.expected_size();
            unranged = true;
            continue;
        }

        auto finish_ec = sink.finish();
        result.bytes_downloaded = sink.offset();
        result.expected_size = sink.expected_size();
        result.retry_after = sink.retry_after();

        if (sink.error()) {
            result.error = sink.error();
        } else if (finish_ec) {
            result.error = finish_ec;
        } else if (sink.stopped() || stop.stop_requested()) {
            result.error = make_error_code(DownloadErrc::cancelled);
        } else if (fetch_ec) {
            result.error = fetch_ec;
        } else if (sink.restart_unranged()) {
            result.error = make_error_code(DownloadErrc::range_not_satisfiable);
        } else if (result.expected_size && result.bytes_downloaded < *result.expected_size) {
            // Body ended early
            result.error = make_error_code(DownloadErrc::connection_lost);
        } else if (!result.expected_size) {
            // No length announced; the body ended where the server closed it
            result.expected_size = result.bytes_downloaded;
            listener_.on_checkpoint(task.id, result.bytes_downloaded, result.expected_size);
        }

        if (!result.error) {
            sink.publish_progress();
        }
        break;
    }

    writer.close();
    return result;
}

} // namespace shelf::core
