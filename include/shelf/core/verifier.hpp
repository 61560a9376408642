// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/error.hpp>
#include <shelf/core/task.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace shelf::core {

// True for "sha256", "sha1", "sha512" and "md5" (any case)
[[nodiscard]] bool is_supported_algorithm(std::string_view algorithm) noexcept;

// Lower-case hex digest of the whole file
[[nodiscard]] std::expected<std::string, std::error_code>
compute_digest(const std::string& path, std::string_view algorithm);

// Final check of a finished download. Reads the file, never modifies it.
// Returns size_mismatch, checksum_mismatch, or the error that stopped reading.
[[nodiscard]] std::error_code verify_file(const std::string& path,
                                          std::optional<std::uint64_t> expected_size,
                                          const std::optional<Checksum>& expected_checksum);

} // namespace shelf::core
