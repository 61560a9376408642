// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>
#include <vector>

namespace shelf::core {

namespace {

constexpr std::size_t LOG_FILE_SIZE = 5 * 1024 * 1024;  // 5 MB
constexpr std::size_t LOG_FILE_COUNT = 3;

} // namespace

void init_logging(std::string_view level, const std::filesystem::path& log_file) {
    auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    std::string file_error;
    if (!log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_file.parent_path(), ec);
        if (ec) {
            file_error = ec.message();
        } else {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file.string(), LOG_FILE_SIZE, LOG_FILE_COUNT);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("shelf", sinks.begin(), sinks.end());
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("log file {} disabled: {}", log_file.string(), file_error);
    }
}

} // namespace shelf::core
