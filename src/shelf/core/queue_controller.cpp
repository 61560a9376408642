// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/queue_controller.hpp>
#include <shelf/core/url.hpp>
#include <shelf/core/verifier.hpp>
#include <shelf/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <utility>

namespace shelf::core {

//=============================================================================
// RetryPolicy
//=============================================================================

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t retry_count) const noexcept {
    if (retry_count == 0) {
        return std::chrono::milliseconds{0};
    }
    auto delay = base_delay;
    for (std::uint32_t i = 1; i < retry_count && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

//=============================================================================
// QueueController
//=============================================================================

QueueController::QueueController(TaskStore& store, HttpTransport& transport,
                                 EventNotifier& notifier, ControllerConfig config)
    : store_(store)
    , transport_(transport)
    , notifier_(notifier)
    , config_(std::move(config))
    , rng_(std::random_device{}())
    , pool_(std::max<std::uint32_t>(config_.concurrency, 1))
    , timer_thread_([this](std::stop_token stop) { timer_loop(stop); }) {
    if (config_.concurrency == 0) {
        config_.concurrency = 1;
    }
}

QueueController::~QueueController() {
    shutdown();
}

std::string QueueController::default_destination(std::string_view download_dir,
                                                 std::string_view source_id,
                                                 std::string_view filename) {
    std::filesystem::path path(download_dir);
    if (!source_id.empty()) {
        std::string folder(source_id);
        std::replace(folder.begin(), folder.end(), '/', '_');
        path /= folder;
    }
    path /= filename;
    return path.string();
}

std::error_code QueueController::restore() {
    auto loaded = store_.load_all();
    if (!loaded) {
        spdlog::error("restore failed: {}", loaded.error().message());
        return loaded.error();
    }

    Saves saves;
    {
        std::lock_guard lock(mutex_);
        for (auto& task : *loaded) {
            if (tasks_.contains(task.id)) {
                continue;
            }
            next_seq_ = std::max(next_seq_, task.queue_seq + 1);

            if (!is_terminal(task.state)) {
                // The record may run ahead of a file that lost its tail
                auto on_disk = disk::file_size(task.destination_path);
                std::uint64_t length = on_disk ? *on_disk : 0;
                task.bytes_downloaded = std::min(task.bytes_downloaded, length);
                if (task.expected_size && task.bytes_downloaded > *task.expected_size) {
                    task.bytes_downloaded = 0;
                }
                task.state = TaskState::queued;
                touch(task, saves);
            }

            spdlog::debug("restored task {} ({}, {} bytes)", task.id,
                          to_string(task.state), task.bytes_downloaded);
            auto [it, inserted] = tasks_.emplace(task.id, std::move(task));
            notifier_.publish(TaskAdded{it->second});
        }
        spdlog::info("restored {} task(s)", loaded->size());
        admit_locked(saves);
    }
    persist(saves);
    return {};
}

std::expected<TaskId, std::error_code> QueueController::enqueue(EnqueueRequest request) {
    if (request.destination_path.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::empty_destination));
    }

    auto url = Url::parse(request.url);
    if (!url) {
        return std::unexpected(url.error());
    }

    if (request.expected_checksum &&
        (!is_supported_algorithm(request.expected_checksum->algorithm) ||
         request.expected_checksum->hex.empty())) {
        return std::unexpected(make_error_code(DownloadErrc::unsupported_checksum));
    }

    auto destination = resolve_destination(request.destination_path);

    // Adopt what an earlier run left behind
    std::uint64_t adopted = 0;
    if (auto on_disk = disk::file_size(destination)) {
        adopted = *on_disk;
        if (request.expected_size && adopted > *request.expected_size) {
            adopted = 0;
        }
    }

    Saves saves;
    TaskId id;
    {
        std::lock_guard lock(mutex_);

        for (const auto& [existing_id, existing] : tasks_) {
            if (existing.destination_path == destination && !is_terminal(existing.state)) {
                return existing_id;
            }
        }
        if (adopted > 0 && destination_claimed_locked(destination, {})) {
            // Still written or about to be deleted by a cancelled task
            adopted = 0;
        }

        DownloadTask task;
        task.id = make_id_locked();
        task.source_id = std::move(request.source_id);
        task.filename = request.filename.empty()
            ? std::filesystem::path(destination).filename().string()
            : std::move(request.filename);
        task.source_url = url->full();
        task.destination_path = destination;
        task.expected_size = request.expected_size;
        task.expected_checksum = std::move(request.expected_checksum);
        task.bytes_downloaded = adopted;
        task.state = TaskState::queued;
        task.created_at = Clock::now();
        task.queue_seq = next_seq_++;

        if (adopted > 0) {
            spdlog::info("task {}: adopting {} existing bytes at {}", task.id, adopted, destination);
        }

        id = task.id;
        auto [it, inserted] = tasks_.emplace(id, std::move(task));
        touch(it->second, saves);
        notifier_.publish(TaskAdded{it->second});
        spdlog::info("queued {} -> {}", it->second.source_url, destination);

        admit_locked(saves);
    }
    persist(saves);
    return id;
}

std::error_code QueueController::pause(const TaskId& id) {
    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (!task) {
            return make_error_code(DownloadErrc::unknown_task);
        }

        switch (task->state) {
            case TaskState::queued:
                not_before_.erase(id);
                transition_locked(*task, TaskState::paused, saves);
                break;
            case TaskState::active:
                if (auto it = leases_.find(id); it != leases_.end()) {
                    it->second.stop.request_stop();
                }
                transition_locked(*task, TaskState::paused, saves);
                break;
            default:
                return make_error_code(DownloadErrc::invalid_transition);
        }
    }
    persist(saves);
    return {};
}

std::error_code QueueController::resume(const TaskId& id) {
    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (!task) {
            return make_error_code(DownloadErrc::unknown_task);
        }
        if (task->state != TaskState::paused) {
            return make_error_code(DownloadErrc::invalid_transition);
        }

        task->queue_seq = next_seq_++;
        transition_locked(*task, TaskState::queued, saves);
        admit_locked(saves);
    }
    persist(saves);
    return {};
}

std::error_code QueueController::cancel(const TaskId& id, bool delete_partial) {
    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (!task) {
            return make_error_code(DownloadErrc::unknown_task);
        }

        switch (task->state) {
            case TaskState::queued:
            case TaskState::active:
            case TaskState::paused:
                break;
            default:
                return make_error_code(DownloadErrc::invalid_transition);
        }

        not_before_.erase(id);
        transition_locked(*task, TaskState::cancelled, saves);

        if (auto it = leases_.find(id); it != leases_.end()) {
            // The worker still owns the file; it goes when the worker lets go
            it->second.stop.request_stop();
            it->second.delete_partial = it->second.delete_partial || delete_partial;
        } else if (delete_partial) {
            delete_partial_locked(task->destination_path, id, saves);
        }

        admit_locked(saves);
    }
    persist(saves);
    remove_released_files();
    return {};
}

std::error_code QueueController::retry(const TaskId& id, bool prioritise) {
    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (!task) {
            return make_error_code(DownloadErrc::unknown_task);
        }
        if (task->state != TaskState::failed && task->state != TaskState::cancelled) {
            return make_error_code(DownloadErrc::invalid_transition);
        }
        if (destination_busy_locked(task->destination_path, id)) {
            // A newer task already downloads to the same file
            return make_error_code(DownloadErrc::invalid_transition);
        }

        if (prioritise) {
            std::int64_t front = next_seq_;
            for (const auto& [other_id, other] : tasks_) {
                front = std::min(front, other.queue_seq);
            }
            task->queue_seq = front - 1;
        } else {
            task->queue_seq = next_seq_++;
        }

        task->retry_count = 0;
        task->last_error.clear();
        not_before_.erase(id);
        transition_locked(*task, TaskState::queued, saves);
        admit_locked(saves);
    }
    persist(saves);
    return {};
}

std::error_code QueueController::purge(const TaskId& id) {
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (!task) {
            return make_error_code(DownloadErrc::unknown_task);
        }
        if (!is_terminal(task->state)) {
            return make_error_code(DownloadErrc::not_terminal);
        }
        tasks_.erase(id);
        notifier_.publish(TaskRemoved{id});
        state_cv_.notify_all();
    }

    if (auto ec = store_.remove(id)) {
        spdlog::error("task {}: record not removed: {}", id, ec.message());
        return ec;
    }
    return {};
}

std::size_t QueueController::purge_terminal() {
    std::vector<TaskId> removed;
    {
        std::lock_guard lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (is_terminal(it->second.state)) {
                removed.push_back(it->first);
                notifier_.publish(TaskRemoved{it->first});
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
        state_cv_.notify_all();
    }

    for (const auto& id : removed) {
        if (auto ec = store_.remove(id)) {
            spdlog::error("task {}: record not removed: {}", id, ec.message());
        }
    }
    return removed.size();
}

std::error_code QueueController::set_concurrency(std::uint32_t concurrency) {
    if (concurrency < 1) {
        return make_error_code(DownloadErrc::invalid_concurrency);
    }

    pool_.resize(concurrency);

    Saves saves;
    {
        std::lock_guard lock(mutex_);
        config_.concurrency = concurrency;
        spdlog::info("concurrency set to {}", concurrency);
        admit_locked(saves);
    }
    persist(saves);
    return {};
}

std::uint32_t QueueController::concurrency() const {
    std::lock_guard lock(mutex_);
    return config_.concurrency;
}

std::vector<DownloadTask> QueueController::list_tasks() const {
    std::vector<DownloadTask> tasks;
    {
        std::lock_guard lock(mutex_);
        tasks.reserve(tasks_.size());
        for (const auto& [id, task] : tasks_) {
            tasks.push_back(task);
        }
    }
    std::sort(tasks.begin(), tasks.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.queue_seq < b.queue_seq;
    });
    return tasks;
}

std::optional<DownloadTask> QueueController::task(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool QueueController::wait_for_state(const TaskId& id, TaskState state,
                                     std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [&] {
        auto it = tasks_.find(id);
        return it != tasks_.end() && it->second.state == state;
    });
}

bool QueueController::wait_settled(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return settled_locked(); });
}

void QueueController::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        for (auto& [id, lease] : leases_) {
            lease.stop.request_stop();
        }
    }
    spdlog::debug("queue controller shutting down");

    timer_thread_.request_stop();
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    // Running transfers checkpoint and return; queued jobs are dropped
    pool_.stop();
}

//=============================================================================
// Worker side
//=============================================================================

void QueueController::on_progress(const TaskId& id, const TransferProgress& progress) {
    std::lock_guard lock(mutex_);
    auto* task = find_locked(id);
    if (!task || task->state != TaskState::active) {
        return;
    }
    task->speed_bps = progress.speed_bps;
    task->eta_seconds = progress.eta_seconds;
    notifier_.publish(ProgressEvent{id, progress.bytes_downloaded, progress.expected_size,
                                    progress.speed_bps, progress.eta_seconds});
}

void QueueController::on_checkpoint(const TaskId& id, std::uint64_t bytes_downloaded,
                                    std::optional<std::uint64_t> expected_size) {
    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (!task) {
            return;
        }
        task->bytes_downloaded = bytes_downloaded;
        if (expected_size) {
            task->expected_size = expected_size;
        }
        touch(*task, saves);
    }
    persist(saves);
}

void QueueController::run_transfer(DownloadTask snapshot, std::stop_token stop) {
    TransferWorker worker(transport_, *this, config_.transfer);
    auto result = worker.run(snapshot, stop);

    const auto& id = snapshot.id;
    bool verify = false;
    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);

        if (task) {
            task->bytes_downloaded = result.bytes_downloaded;
            if (result.expected_size) {
                task->expected_size = result.expected_size;
            }
            task->speed_bps = 0;
            task->eta_seconds.reset();
        }

        if (!task || task->state != TaskState::active) {
            // Paused, cancelled or purged while running
            if (task) {
                touch(*task, saves);
            }
            release_locked(id, saves);
        } else if (classify(result.error) == FailureKind::cancelled) {
            // Shutdown; the record stays active so restore picks it up
            touch(*task, saves);
            release_locked(id, saves);
        } else if (!result.error) {
            transition_locked(*task, TaskState::verifying, saves);
            verify = true;
        } else {
            fail_locked(*task, result, saves);
            release_locked(id, saves);
        }

        admit_locked(saves);
    }
    persist(saves);
    remove_released_files();

    if (verify) {
        run_verification(id, stop);
    }
}

void QueueController::run_verification(const TaskId& id, std::stop_token stop) {
    std::string path;
    std::optional<std::uint64_t> expected_size;
    std::optional<Checksum> checksum;
    {
        Saves saves;
        std::unique_lock lock(mutex_);
        auto* task = find_locked(id);
        if (!task || stop.stop_requested()) {
            // Left in verifying; restore checks the file again
            release_locked(id, saves);
            lock.unlock();
            persist(saves);
            remove_released_files();
            return;
        }
        path = task->destination_path;
        expected_size = task->expected_size;
        checksum = task->expected_checksum;
    }

    spdlog::debug("task {}: verifying {}", id, path);
    auto ec = verify_file(path, expected_size, checksum);

    Saves saves;
    {
        std::lock_guard lock(mutex_);
        auto* task = find_locked(id);
        if (task && task->state == TaskState::verifying) {
            if (!ec) {
                spdlog::info("task {}: completed {}", id, path);
                task->last_error.clear();
                transition_locked(*task, TaskState::completed, saves);
            } else {
                // The file is not trusted; a retry starts over
                spdlog::error("task {}: verification failed: {}", id, ec.message());
                ++task->retry_count;
                task->bytes_downloaded = 0;
                task->last_error = ec.message();
                transition_locked(*task, TaskState::failed, saves, task->last_error);
            }
        }
        release_locked(id, saves);
        admit_locked(saves);
    }
    persist(saves);
    remove_released_files();
}

//=============================================================================
// Locked helpers
//=============================================================================

void QueueController::admit_locked(Saves& saves) {
    if (stopping_) {
        return;
    }

    auto now = steady::now();
    while (leases_.size() < config_.concurrency) {
        DownloadTask* next = nullptr;
        for (auto& [id, task] : tasks_) {
            if (task.state != TaskState::queued || leases_.contains(id)) {
                continue;
            }
            if (destination_claimed_locked(task.destination_path, id)) {
                continue;
            }
            if (auto it = not_before_.find(id); it != not_before_.end() && it->second > now) {
                continue;
            }
            if (!next || task.queue_seq < next->queue_seq) {
                next = &task;
            }
        }
        if (!next) {
            break;
        }
        start_locked(*next, saves);
    }
}

void QueueController::start_locked(DownloadTask& task, Saves& saves) {
    not_before_.erase(task.id);
    transition_locked(task, TaskState::active, saves);

    Lease lease;
    lease.destination_path = task.destination_path;
    auto token = lease.stop.get_token();
    leases_.emplace(task.id, std::move(lease));

    spdlog::info("starting {} ({} of {} bytes)", task.filename, task.bytes_downloaded,
                 task.expected_size ? std::to_string(*task.expected_size) : std::string("?"));

    if (!pool_.submit([this, snapshot = task, token]() mutable {
            run_transfer(std::move(snapshot), token);
        })) {
        spdlog::error("task {}: worker pool stopped", task.id);
        leases_.erase(task.id);
    }
}

void QueueController::transition_locked(DownloadTask& task, TaskState next, Saves& saves,
                                        const std::string& error) {
    auto old = task.state;
    task.state = next;
    if (next != TaskState::active) {
        task.speed_bps = 0;
        task.eta_seconds.reset();
    }

    spdlog::debug("task {}: {} -> {}", task.id, to_string(old), to_string(next));
    notifier_.publish(StateChanged{task.id, old, next, error});
    touch(task, saves);
    state_cv_.notify_all();
}

void QueueController::fail_locked(DownloadTask& task, const TransferResult& result, Saves& saves) {
    auto kind = classify(result.error);
    auto message = result.error.message();
    task.last_error = message;

    if (kind == FailureKind::network_transient && task.retry_count < config_.retry.max_retries) {
        ++task.retry_count;
        auto delay = config_.retry.delay_for(task.retry_count);
        if (result.retry_after) {
            delay = std::max(delay, std::chrono::duration_cast<std::chrono::milliseconds>(*result.retry_after));
        }

        spdlog::warn("task {}: {} (retry {}/{} in {} ms)", task.id, message,
                     task.retry_count, config_.retry.max_retries, delay.count());

        not_before_[task.id] = steady::now() + delay;
        timer_dirty_ = true;
        timer_cv_.notify_all();
        transition_locked(task, TaskState::queued, saves, message);
        return;
    }

    if (kind == FailureKind::verification_failed) {
        ++task.retry_count;
    }

    spdlog::error("task {}: failed ({}): {}", task.id, to_string(kind), message);
    transition_locked(task, TaskState::failed, saves, message);
}

void QueueController::release_locked(const TaskId& id, Saves& saves) {
    auto it = leases_.find(id);
    if (it == leases_.end()) {
        return;
    }

    bool remove_file = it->second.delete_partial;
    auto path = std::move(it->second.destination_path);
    leases_.erase(it);

    if (remove_file) {
        delete_partial_locked(path, id, saves);
    } else if (destination_busy_locked(path, id)) {
        // The file now belongs to a newer task
        if (auto* task = find_locked(id)) {
            task->bytes_downloaded = 0;
            touch(*task, saves);
        }
    }
    state_cv_.notify_all();
}

void QueueController::delete_partial_locked(const std::string& path, const TaskId& id, Saves& saves) {
    if (auto* task = find_locked(id)) {
        task->bytes_downloaded = 0;
        touch(*task, saves);
    }

    if (destination_busy_locked(path, id)) {
        // A newer task owns the path and truncates it when it starts
        spdlog::info("task {}: {} belongs to another task, not deleted", id, path);
        return;
    }

    // Claimed until remove_released_files() runs outside the lock
    removals_.push_back(path);
    removing_.insert(path);
}

void QueueController::touch(DownloadTask& task, Saves& saves) {
    ++task.revision;
    task.updated_at = Clock::now();
    saves.push_back(task);
}

DownloadTask* QueueController::find_locked(const TaskId& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

bool QueueController::destination_busy_locked(const std::string& path, const TaskId& except) const {
    return std::any_of(tasks_.begin(), tasks_.end(), [&](const auto& entry) {
        return entry.first != except
            && entry.second.destination_path == path
            && !is_terminal(entry.second.state);
    });
}

bool QueueController::destination_claimed_locked(const std::string& path, const TaskId& except) const {
    if (removing_.contains(path)) {
        return true;
    }
    return std::any_of(leases_.begin(), leases_.end(), [&](const auto& entry) {
        return entry.first != except && entry.second.destination_path == path;
    });
}

bool QueueController::settled_locked() const {
    if (!leases_.empty() || !removing_.empty()) {
        return false;
    }
    return std::none_of(tasks_.begin(), tasks_.end(), [](const auto& entry) {
        auto state = entry.second.state;
        return state == TaskState::queued
            || state == TaskState::active
            || state == TaskState::verifying;
    });
}

TaskId QueueController::make_id_locked() {
    while (true) {
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng_()));
        TaskId id(buf);
        if (!tasks_.contains(id)) {
            return id;
        }
    }
}

std::string QueueController::resolve_destination(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.is_relative() && !config_.download_dir.empty()) {
        p = std::filesystem::path(config_.download_dir) / p;
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(p, ec);
    if (ec) {
        return p.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

//=============================================================================
// Persistence and backoff timer
//=============================================================================

void QueueController::persist(const Saves& saves) {
    for (const auto& task : saves) {
        if (auto ec = store_.save(task)) {
            spdlog::error("task {}: record not saved: {}", task.id, ec.message());
        }
    }
}

void QueueController::remove_released_files() {
    std::vector<std::string> paths;
    {
        std::lock_guard lock(mutex_);
        paths.swap(removals_);
    }
    if (paths.empty()) {
        return;
    }

    for (const auto& path : paths) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            spdlog::warn("cannot delete {}: {}", path, ec.message());
        } else {
            spdlog::info("deleted partial file {}", path);
        }
    }

    Saves saves;
    {
        std::lock_guard lock(mutex_);
        for (const auto& path : paths) {
            if (auto it = removing_.find(path); it != removing_.end()) {
                removing_.erase(it);
            }
        }
        admit_locked(saves);
        state_cv_.notify_all();
    }
    persist(saves);
}

void QueueController::timer_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        timer_dirty_ = false;

        if (not_before_.empty()) {
            timer_cv_.wait(lock, stop, [this] { return timer_dirty_; });
            continue;
        }

        auto earliest = std::min_element(not_before_.begin(), not_before_.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; })->second;

        if (steady::now() < earliest) {
            timer_cv_.wait_until(lock, stop, earliest, [this] { return timer_dirty_; });
            continue;
        }

        auto now = steady::now();
        std::erase_if(not_before_, [now](const auto& entry) { return entry.second <= now; });

        Saves saves;
        admit_locked(saves);
        if (!saves.empty()) {
            lock.unlock();
            persist(saves);
            lock.lock();
        }
    }
}

} // namespace shelf::core
