// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <string_view>

namespace shelf::core {

// Install the default logger: colour console sink, plus a rotating file
// sink when `log_file` is not empty. `level` is an spdlog level name
// ("trace", "debug", "info", "warn", "error", "off"); unknown names mean info.
void init_logging(std::string_view level, const std::filesystem::path& log_file = {});

} // namespace shelf::core
