// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/error.hpp>
#include <shelf/disk/error.hpp>

namespace shelf::core {

FailureKind classify(const std::error_code& ec) noexcept {
    if (!ec) {
        return FailureKind::none;
    }

    if (ec.category() == disk::disk_errc_category() ||
        ec.category() == std::system_category() ||
        ec.category() == std::generic_category()) {
        return FailureKind::disk_io;
    }

    if (ec.category() != download_errc_category()) {
        return FailureKind::network_fatal;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::timeout:
        case DownloadErrc::connection_lost:
        case DownloadErrc::dns_error:
        case DownloadErrc::server_error:
        case DownloadErrc::rate_limited:
            return FailureKind::network_transient;

        case DownloadErrc::range_ignored:
        case DownloadErrc::range_not_satisfiable:
            return FailureKind::range_unsupported;

        case DownloadErrc::store_error:
            return FailureKind::disk_io;

        case DownloadErrc::size_mismatch:
        case DownloadErrc::checksum_mismatch:
            return FailureKind::verification_failed;

        case DownloadErrc::empty_destination:
        case DownloadErrc::unsupported_checksum:
        case DownloadErrc::invalid_concurrency:
            return FailureKind::invalid_request;

        case DownloadErrc::invalid_transition:
        case DownloadErrc::unknown_task:
        case DownloadErrc::not_terminal:
            return FailureKind::invalid_transition;

        case DownloadErrc::cancelled:
            return FailureKind::cancelled;

        case DownloadErrc::success:
            return FailureKind::none;

        default:
            return FailureKind::network_fatal;
    }
}

std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::none:                return "none";
        case FailureKind::network_transient:   return "network_transient";
        case FailureKind::network_fatal:       return "network_fatal";
        case FailureKind::range_unsupported:   return "range_unsupported";
        case FailureKind::disk_io:             return "disk_io";
        case FailureKind::verification_failed: return "verification_failed";
        case FailureKind::invalid_request:     return "invalid_request";
        case FailureKind::invalid_transition:  return "invalid_transition";
        case FailureKind::cancelled:           return "cancelled";
    }
    return "unknown";
}

} // namespace shelf::core
