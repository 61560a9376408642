// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace shelf::core {

enum class DownloadErrc {
    success = 0,

    // Network, retried with backoff
    timeout,
    connection_lost,
    dns_error,
    server_error,
    rate_limited,

    // Network, fatal
    not_found,
    http_client_error,
    invalid_url,
    ssl_error,
    too_many_redirects,

    // Server ignored or rejected the byte range
    range_ignored,
    range_not_satisfiable,

    // Integrity
    size_mismatch,
    checksum_mismatch,

    // Command boundary
    empty_destination,
    unsupported_checksum,
    invalid_concurrency,
    invalid_transition,
    unknown_task,
    not_terminal,

    // Transfer stopped through its stop token
    cancelled,
    store_error,
};

// How a failure is handled by the queue
enum class FailureKind : std::uint8_t {
    none,
    network_transient,
    network_fatal,
    range_unsupported,
    disk_io,
    verification_failed,
    invalid_request,
    invalid_transition,
    cancelled,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "shelf::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:               return "Success";
            case DownloadErrc::timeout:               return "Operation timed out";
            case DownloadErrc::connection_lost:       return "Connection lost";
            case DownloadErrc::dns_error:             return "DNS resolution failed";
            case DownloadErrc::server_error:          return "Server error (5xx)";
            case DownloadErrc::rate_limited:          return "Rate limited (429)";
            case DownloadErrc::not_found:             return "Resource not found (404)";
            case DownloadErrc::http_client_error:     return "HTTP client error (4xx)";
            case DownloadErrc::invalid_url:           return "Invalid URL";
            case DownloadErrc::ssl_error:             return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:    return "Too many redirects";
            case DownloadErrc::range_ignored:         return "Server ignored the byte range";
            case DownloadErrc::range_not_satisfiable: return "Byte range not satisfiable (416)";
            case DownloadErrc::size_mismatch:         return "File size does not match the expected size";
            case DownloadErrc::checksum_mismatch:     return "Checksum mismatch";
            case DownloadErrc::empty_destination:     return "Destination path is empty";
            case DownloadErrc::unsupported_checksum:  return "Unsupported checksum algorithm";
            case DownloadErrc::invalid_concurrency:   return "Concurrency must be at least 1";
            case DownloadErrc::invalid_transition:    return "Invalid state transition";
            case DownloadErrc::unknown_task:          return "Unknown task";
            case DownloadErrc::not_terminal:          return "Task is not in a terminal state";
            case DownloadErrc::cancelled:             return "Transfer stopped";
            case DownloadErrc::store_error:           return "Task store error";
            default:                                  return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Map any error produced by the core to the way the queue handles it
[[nodiscard]] FailureKind classify(const std::error_code& ec) noexcept;

[[nodiscard]] inline bool is_transient(const std::error_code& ec) noexcept {
    return classify(ec) == FailureKind::network_transient;
}

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

} // namespace shelf::core

namespace std {

template<>
struct is_error_code_enum<shelf::core::DownloadErrc> : true_type {};

} // namespace std
