// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/error.hpp>
#include <shelf/core/task.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shelf::core {

// Durable task records, one JSON document per task (<dir>/<id>.json).
// Every save replaces the record atomically: temporary file, fsync, rename,
// directory fsync. Safe to call from any thread.
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path directory);

    // Non-copyable
    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // Create the directory if needed
    [[nodiscard]] std::error_code open();

    // Write the record unless a newer revision was already written
    [[nodiscard]] std::error_code save(const DownloadTask& task);

    // Every readable record, ordered by queue_seq. Corrupt records are
    // skipped, leftover temporary files removed.
    [[nodiscard]] std::expected<std::vector<DownloadTask>, std::error_code> load_all();

    [[nodiscard]] std::error_code remove(const TaskId& id);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path record_path(const TaskId& id) const;

    std::filesystem::path directory_;
    std::mutex mutex_;
    std::unordered_map<TaskId, std::uint64_t> written_revisions_;
};

// Record encoding
[[nodiscard]] nlohmann::json task_to_json(const DownloadTask& task);
[[nodiscard]] std::expected<DownloadTask, std::error_code> task_from_json(const nlohmann::json& j);

} // namespace shelf::core
