// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/config.hpp>
#include <shelf/core/error.hpp>
#include <shelf/core/event_notifier.hpp>
#include <shelf/core/http_transport.hpp>
#include <shelf/core/task.hpp>
#include <shelf/core/task_store.hpp>
#include <shelf/core/transfer_worker.hpp>
#include <shelf/core/worker_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace shelf::core {

struct RetryPolicy {
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds base_delay{RETRY_BASE_DELAY};
    std::chrono::milliseconds max_delay{RETRY_MAX_DELAY};

    // Backoff before retry number `retry_count` (1-based): base * 2^(n-1), capped
    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t retry_count) const noexcept;
};

struct ControllerConfig {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::string download_dir;  // base for relative destinations
    RetryPolicy retry;
    TransferConfig transfer;
};

struct EnqueueRequest {
    std::string url;
    std::string destination_path;
    std::string source_id;
    std::string filename;  // empty: the destination's file name
    std::optional<std::uint64_t> expected_size;
    std::optional<Checksum> expected_checksum;
};

// Owns the task set: admission, commands, retry/backoff and restore.
// Every mutation happens under one mutex; records are written afterwards,
// outside the lock. Events are published in transition order.
class QueueController final : private TransferListener {
public:
    QueueController(TaskStore& store, HttpTransport& transport,
                    EventNotifier& notifier, ControllerConfig config);
    ~QueueController() override;

    // Non-copyable, non-movable
    QueueController(const QueueController&) = delete;
    QueueController& operator=(const QueueController&) = delete;

    // Load persisted tasks; unfinished ones are queued again
    [[nodiscard]] std::error_code restore();

    [[nodiscard]] std::expected<TaskId, std::error_code> enqueue(EnqueueRequest request);

    [[nodiscard]] std::error_code pause(const TaskId& id);
    [[nodiscard]] std::error_code resume(const TaskId& id);
    [[nodiscard]] std::error_code cancel(const TaskId& id, bool delete_partial = false);
    [[nodiscard]] std::error_code retry(const TaskId& id, bool prioritise = false);

    // Remove terminal tasks and their records (files stay)
    [[nodiscard]] std::error_code purge(const TaskId& id);
    std::size_t purge_terminal();

    [[nodiscard]] std::error_code set_concurrency(std::uint32_t concurrency);
    [[nodiscard]] std::uint32_t concurrency() const;

    // Snapshots, ordered by queue position
    [[nodiscard]] std::vector<DownloadTask> list_tasks() const;
    [[nodiscard]] std::optional<DownloadTask> task(const TaskId& id) const;

    // True once the task is in `state`, false on timeout
    bool wait_for_state(const TaskId& id, TaskState state, std::chrono::milliseconds timeout) const;

    // True once nothing is queued or running and every worker let go
    bool wait_settled(std::chrono::milliseconds timeout) const;

    // Stop the workers; unfinished tasks keep their state for the next restore
    void shutdown();

    // <download_dir>/<source_id with '/' as '_'>/<filename>
    [[nodiscard]] static std::string default_destination(std::string_view download_dir,
                                                         std::string_view source_id,
                                                         std::string_view filename);

private:
    using steady = std::chrono::steady_clock;
    using Saves = std::vector<DownloadTask>;

    // Held by exactly one worker per task, from admission until it returns
    struct Lease {
        std::stop_source stop;
        std::string destination_path;
        bool delete_partial{false};
    };

    // TransferListener
    void on_progress(const TaskId& id, const TransferProgress& progress) override;
    void on_checkpoint(const TaskId& id, std::uint64_t bytes_downloaded,
                       std::optional<std::uint64_t> expected_size) override;

    void run_transfer(DownloadTask snapshot, std::stop_token stop);
    void run_verification(const TaskId& id, std::stop_token stop);

    void admit_locked(Saves& saves);
    void start_locked(DownloadTask& task, Saves& saves);
    void transition_locked(DownloadTask& task, TaskState next, Saves& saves,
                           const std::string& error = {});
    void fail_locked(DownloadTask& task, const TransferResult& result, Saves& saves);
    void release_locked(const TaskId& id, Saves& saves);
    void delete_partial_locked(const std::string& path, const TaskId& id, Saves& saves);
    void touch(DownloadTask& task, Saves& saves);

    [[nodiscard]] DownloadTask* find_locked(const TaskId& id);
    [[nodiscard]] bool destination_busy_locked(const std::string& path, const TaskId& except) const;
    // A worker of another task still has the file open, or it waits to be deleted
    [[nodiscard]] bool destination_claimed_locked(const std::string& path, const TaskId& except) const;
    [[nodiscard]] bool settled_locked() const;
    [[nodiscard]] TaskId make_id_locked();
    [[nodiscard]] std::string resolve_destination(const std::string& path) const;

    void persist(const Saves& saves);
    void remove_released_files();
    void timer_loop(std::stop_token stop);

    TaskStore& store_;
    HttpTransport& transport_;
    EventNotifier& notifier_;
    ControllerConfig config_;

    mutable std::mutex mutex_;
    mutable std::condition_variable state_cv_;
    std::condition_variable_any timer_cv_;

    std::map<TaskId, DownloadTask> tasks_;
    std::map<TaskId, Lease> leases_;
    std::map<TaskId, steady::time_point> not_before_;
    std::vector<std::string> removals_;       // partial files to delete outside the lock
    std::multiset<std::string> removing_;     // claimed until deleted
    std::int64_t next_seq_{1};
    bool timer_dirty_{false};
    bool stopping_{false};
    std::mt19937_64 rng_;

    WorkerPool pool_;
    std::jthread timer_thread_;
};

} // namespace shelf::core
