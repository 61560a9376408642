// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/task_store.hpp>
#include <shelf/disk/error.hpp>
#include <shelf/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace shelf::core {

namespace {

constexpr int RECORD_FORMAT = 1;
constexpr std::string_view RECORD_EXT = ".json";
constexpr std::string_view TEMP_EXT = ".tmp";

// Marks a removed id so late saves cannot bring the record back
constexpr std::uint64_t REMOVED = std::numeric_limits<std::uint64_t>::max();

std::int64_t to_epoch_ms(Clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point from_epoch_ms(std::int64_t ms) noexcept {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

// Write all of `data` to a new file and flush it to disk
std::error_code write_durable(const std::filesystem::path& path, const std::string& data) noexcept {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return disk::errno_to_error_code(errno);
    }

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = disk::errno_to_error_code(errno);
            ::close(fd);
            return ec;
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        auto ec = disk::errno_to_error_code(errno);
        ::close(fd);
        return ec;
    }
    if (::close(fd) != 0) {
        return disk::errno_to_error_code(errno);
    }
    return {};
}

std::error_code sync_directory(const std::filesystem::path& dir) noexcept {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return disk::errno_to_error_code(errno);
    }
    std::error_code ec;
    if (::fsync(fd) != 0) {
        ec = disk::errno_to_error_code(errno);
    }
    ::close(fd);
    return ec;
}

} // namespace

//=============================================================================
// Record encoding
//=============================================================================

nlohmann::json task_to_json(const DownloadTask& task) {
    nlohmann::json j;
    j["format"] = RECORD_FORMAT;
    j["id"] = task.id;
    j["source_id"] = task.source_id;
    j["filename"] = task.filename;
    j["source_url"] = task.source_url;
    j["destination_path"] = task.destination_path;

    if (task.expected_size) {
        j["expected_size"] = *task.expected_size;
    } else {
        j["expected_size"] = nullptr;
    }

    if (task.expected_checksum) {
        j["expected_checksum"] = {
            {"algorithm", task.expected_checksum->algorithm},
            {"hex", task.expected_checksum->hex},
        };
    } else {
        j["expected_checksum"] = nullptr;
    }

    j["bytes_downloaded"] = task.bytes_downloaded;
    j["state"] = std::string(to_string(task.state));
    j["retry_count"] = task.retry_count;
    j["last_error"] = task.last_error;
    j["created_at"] = to_epoch_ms(task.created_at);
    j["updated_at"] = to_epoch_ms(task.updated_at);
    j["queue_seq"] = task.queue_seq;
    j["revision"] = task.revision;
    return j;
}

std::expected<DownloadTask, std::error_code> task_from_json(const nlohmann::json& j) {
    try {
        DownloadTask task;

        task.id = j.at("id").get<std::string>();
        task.source_url = j.at("source_url").get<std::string>();
        task.destination_path = j.at("destination_path").get<std::string>();
        if (task.id.empty() || task.destination_path.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::store_error));
        }

        task.source_id = j.value("source_id", std::string{});
        task.filename = j.value("filename", std::string{});

        if (j.contains("expected_size") && !j["expected_size"].is_null()) {
            task.expected_size = j["expected_size"].get<std::uint64_t>();
        }

        if (j.contains("expected_checksum") && j["expected_checksum"].is_object()) {
            const auto& c = j["expected_checksum"];
            task.expected_checksum = Checksum{c.at("algorithm").get<std::string>(),
                                              c.at("hex").get<std::string>()};
        }

        task.bytes_downloaded = j.value("bytes_downloaded", std::uint64_t{0});

        auto state = parse_task_state(j.at("state").get<std::string>());
        if (!state) {
            return std::unexpected(make_error_code(DownloadErrc::store_error));
        }
        task.state = *state;

        task.retry_count = j.value("retry_count", std::uint32_t{0});
        task.last_error = j.value("last_error", std::string{});
        task.created_at = from_epoch_ms(j.value("created_at", std::int64_t{0}));
        task.updated_at = from_epoch_ms(j.value("updated_at", std::int64_t{0}));
        task.queue_seq = j.value("queue_seq", std::int64_t{0});
        task.revision = j.value("revision", std::uint64_t{0});

        return task;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("task record rejected: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::store_error));
    }
}

//=============================================================================
// TaskStore
//=============================================================================

TaskStore::TaskStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::error_code TaskStore::open() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("task store: cannot create {}: {}", directory_.string(), ec.message());
    }
    return ec;
}

std::filesystem::path TaskStore::record_path(const TaskId& id) const {
    return directory_ / (id + std::string(RECORD_EXT));
}

std::error_code TaskStore::save(const DownloadTask& task) {
    std::lock_guard lock(mutex_);

    auto it = written_revisions_.find(task.id);
    if (it != written_revisions_.end() && it->second >= task.revision) {
        // A newer (or the same) revision is already on disk
        return {};
    }

    std::string data = task_to_json(task).dump(2);

    auto path = record_path(task.id);
    auto tmp = path;
    tmp += std::string(TEMP_EXT);

    if (auto ec = write_durable(tmp, data)) {
        spdlog::error("task store: write {} failed: {}", tmp.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return ec;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("task store: rename {} failed: {}", path.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return ec;
    }

    written_revisions_[task.id] = task.revision;
    return sync_directory(directory_);
}

std::expected<std::vector<DownloadTask>, std::error_code> TaskStore::load_all() {
    std::lock_guard lock(mutex_);

    std::vector<DownloadTask> tasks;
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return tasks;
        }
        return std::unexpected(ec);
    }

    for (const auto& entry : it) {
        const auto& path = entry.path();
        auto ext = path.extension().string();

        if (ext == TEMP_EXT) {
            // Interrupted save; the previous record (if any) is still intact
            std::error_code ignored;
            std::filesystem::remove(path, ignored);
            continue;
        }
        if (ext != RECORD_EXT) {
            continue;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            spdlog::warn("task store: cannot read {}", path.string());
            continue;
        }

        auto j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded()) {
            spdlog::warn("task store: skipping corrupt record {}", path.string());
            continue;
        }

        auto task = task_from_json(j);
        if (!task) {
            spdlog::warn("task store: skipping invalid record {}", path.string());
            continue;
        }
        if (path.stem().string() != task->id) {
            spdlog::warn("task store: record {} names task {}", path.string(), task->id);
            continue;
        }

        written_revisions_[task->id] = task->revision;
        tasks.push_back(std::move(*task));
    }

    std::sort(tasks.begin(), tasks.end(), [](const DownloadTask& a, const DownloadTask& b) {
        return a.queue_seq < b.queue_seq;
    });
    return tasks;
}

std::error_code TaskStore::remove(const TaskId& id) {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    std::filesystem::remove(record_path(id), ec);
    if (ec) {
        spdlog::error("task store: remove {} failed: {}", id, ec.message());
        return ec;
    }
    written_revisions_[id] = REMOVED;
    return sync_directory(directory_);
}

} // namespace shelf::core
