// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/settings.hpp>
#include <shelf/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace shelf::core {

namespace {

constexpr const char* KNOWN_KEYS[] = {
    "download_folder",
    "max_concurrent_downloads",
    "max_retries",
    "retry_base_delay_ms",
    "retry_max_delay_ms",
    "chunk_size_kib",
    "checkpoint_every_chunks",
    "checkpoint_interval_ms",
    "log_level",
};

std::filesystem::path home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    return std::filesystem::temp_directory_path();
}

// $<var>, or ~/<fallback> when unset or relative
std::filesystem::path xdg_dir(const char* var, const char* fallback) {
    if (const char* value = std::getenv(var); value && *value) {
        std::filesystem::path p(value);
        if (p.is_absolute()) {
            return p;
        }
    }
    return home_dir() / fallback;
}

template<typename T>
T read_number(const nlohmann::json& j, const char* key, T fallback, T min_value) {
    if (!j.contains(key) || !j[key].is_number_unsigned()) {
        return fallback;
    }
    auto value = j[key].get<std::uint64_t>();
    if (value < static_cast<std::uint64_t>(min_value)) {
        spdlog::warn("settings: {} = {} is below {}, using {}", key, value, min_value, fallback);
        return fallback;
    }
    return static_cast<T>(std::min<std::uint64_t>(value, std::numeric_limits<T>::max()));
}

} // namespace

Settings settings_from_json(const nlohmann::json& j) {
    Settings s;
    if (!j.is_object()) {
        return s;
    }

    if (j.contains("download_folder") && j["download_folder"].is_string()) {
        s.download_folder = j["download_folder"].get<std::string>();
    }
    s.max_concurrent_downloads = read_number<std::uint32_t>(j, "max_concurrent_downloads",
                                                            s.max_concurrent_downloads, 1);
    s.max_retries = read_number<std::uint32_t>(j, "max_retries", s.max_retries, 0);
    s.retry_base_delay_ms = read_number<std::uint32_t>(j, "retry_base_delay_ms", s.retry_base_delay_ms, 0);
    s.retry_max_delay_ms = read_number<std::uint32_t>(j, "retry_max_delay_ms", s.retry_max_delay_ms, 0);
    s.chunk_size_kib = read_number<std::uint32_t>(j, "chunk_size_kib", s.chunk_size_kib, 1);
    s.checkpoint_every_chunks = read_number<std::uint32_t>(j, "checkpoint_every_chunks",
                                                           s.checkpoint_every_chunks, 1);
    s.checkpoint_interval_ms = read_number<std::uint32_t>(j, "checkpoint_interval_ms",
                                                          s.checkpoint_interval_ms, 0);
    if (j.contains("log_level") && j["log_level"].is_string()) {
        s.log_level = j["log_level"].get<std::string>();
    }

    for (const auto& [key, value] : j.items()) {
        if (std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) == std::end(KNOWN_KEYS)) {
            s.extra[key] = value;
        }
    }
    return s;
}

nlohmann::json settings_to_json(const Settings& s) {
    nlohmann::json j = s.extra.is_object() ? s.extra : nlohmann::json::object();
    j["download_folder"] = s.download_folder;
    j["max_concurrent_downloads"] = s.max_concurrent_downloads;
    j["max_retries"] = s.max_retries;
    j["retry_base_delay_ms"] = s.retry_base_delay_ms;
    j["retry_max_delay_ms"] = s.retry_max_delay_ms;
    j["chunk_size_kib"] = s.chunk_size_kib;
    j["checkpoint_every_chunks"] = s.checkpoint_every_chunks;
    j["checkpoint_interval_ms"] = s.checkpoint_interval_ms;
    j["log_level"] = s.log_level;
    return j;
}

std::expected<Settings, std::error_code> Settings::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Settings defaults;
        defaults.download_folder = default_download_dir().string();
        if (auto save_ec = defaults.save(path)) {
            return std::unexpected(save_ec);
        }
        spdlog::info("settings: created {}", path.string());
        return defaults;
    }

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("settings: {} is not valid JSON, using defaults", path.string());
        j = nlohmann::json::object();
    }

    auto settings = settings_from_json(j);
    if (settings.download_folder.empty()) {
        settings.download_folder = default_download_dir().string();
    }
    return settings;
}

std::error_code Settings::save(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    file << settings_to_json(*this).dump(2) << '\n';
    if (!file) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return {};
}

ControllerConfig Settings::to_controller_config() const {
    ControllerConfig config;
    config.concurrency = std::max<std::uint32_t>(max_concurrent_downloads, 1);
    config.download_dir = download_folder.empty() ? default_download_dir().string() : download_folder;
    config.retry.max_retries = max_retries;
    config.retry.base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    config.retry.max_delay = std::chrono::milliseconds(std::max(retry_max_delay_ms, retry_base_delay_ms));
    config.transfer.chunk_size = static_cast<std::size_t>(std::max<std::uint32_t>(chunk_size_kib, 1)) * 1024;
    config.transfer.checkpoint_every_chunks = std::max<std::uint32_t>(checkpoint_every_chunks, 1);
    config.transfer.checkpoint_interval = std::chrono::milliseconds(checkpoint_interval_ms);
    return config;
}

std::filesystem::path default_config_path() {
    return xdg_dir("XDG_CONFIG_HOME", ".config") / "shelf" / "settings.json";
}

std::filesystem::path default_data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share") / "shelf";
}

std::filesystem::path default_download_dir() {
    return home_dir() / "Shelf" / "models";
}

} // namespace shelf::core
