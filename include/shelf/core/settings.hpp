// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/config.hpp>
#include <shelf/core/queue_controller.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace shelf::core {

// User settings, stored as JSON. Missing keys take their defaults and keys
// this version does not know are kept on save.
struct Settings {
    std::string download_folder;
    std::uint32_t max_concurrent_downloads{DEFAULT_CONCURRENCY};
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::uint32_t retry_base_delay_ms{static_cast<std::uint32_t>(RETRY_BASE_DELAY.count())};
    std::uint32_t retry_max_delay_ms{static_cast<std::uint32_t>(RETRY_MAX_DELAY.count())};
    std::uint32_t chunk_size_kib{static_cast<std::uint32_t>(DEFAULT_CHUNK_SIZE / 1024)};
    std::uint32_t checkpoint_every_chunks{CHECKPOINT_EVERY_CHUNKS};
    std::uint32_t checkpoint_interval_ms{static_cast<std::uint32_t>(CHECKPOINT_INTERVAL.count())};
    std::string log_level{"info"};

    nlohmann::json extra = nlohmann::json::object();

    // Read `path`; a missing file is created with the defaults
    [[nodiscard]] static std::expected<Settings, std::error_code> load(const std::filesystem::path& path);

    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const;

    [[nodiscard]] ControllerConfig to_controller_config() const;
};

[[nodiscard]] Settings settings_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json settings_to_json(const Settings& settings);

// $XDG_CONFIG_HOME/shelf/settings.json
[[nodiscard]] std::filesystem::path default_config_path();
// $XDG_DATA_HOME/shelf
[[nodiscard]] std::filesystem::path default_data_dir();
// ~/Shelf/models
[[nodiscard]] std::filesystem::path default_download_dir();

} // namespace shelf::core
