// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/task.hpp>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shelf::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string output_file;
    std::string sha256;
    std::optional<std::uint64_t> expected_size;
    std::uint32_t concurrency{0};  // 0: from settings
    bool list{false};
    bool purge{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;             // first problem found while parsing
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Restore the queue, enqueue `args.urls` and wait until every task settled.
// Returns 1 when a task failed, 130 when interrupted.
[[nodiscard]] CliResult download(const CliArgs& args);

// Failed tasks among `session`, the ids this run restored or queued
[[nodiscard]] std::vector<core::DownloadTask> session_failures(const std::vector<core::DownloadTask>& tasks,
                                                               const std::set<core::TaskId>& session);

// Print the persisted tasks
[[nodiscard]] CliResult list(std::ostream& out);

// Remove the records of finished, failed and cancelled tasks
[[nodiscard]] CliResult purge(std::ostream& out);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace shelf::cli
