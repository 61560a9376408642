// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace shelf::core {

// One GET, optionally starting at a byte offset
struct FetchRequest {
    std::string url;
    std::optional<std::uint64_t> range_start;  // sends "Range: bytes=<n>-"
};

// "Content-Range: bytes first-last/total"
struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;
};

// Status line and headers of the final response (after redirects)
struct ResponseHead {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // lower-case names

    [[nodiscard]] std::optional<std::uint64_t> content_length() const noexcept;
    [[nodiscard]] std::optional<ContentRange> content_range() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> retry_after_seconds() const noexcept;
};

// Receives one response. Returning false aborts the transfer.
class FetchHandler {
public:
    virtual ~FetchHandler() = default;

    // Called once, before any body bytes
    virtual bool on_head(const ResponseHead& head) = 0;

    virtual bool on_body(std::span<const std::byte> data) = 0;
};

// HTTP client seam used by the transfer worker
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Perform the request, streaming the response into `handler`.
    // Returns a transport error (timeout, connection lost, ...), or
    // DownloadErrc::cancelled when the handler or `stop` ended it early.
    // HTTP status codes are not errors at this level.
    [[nodiscard]] virtual std::error_code fetch(const FetchRequest& request,
                                                FetchHandler& handler,
                                                std::stop_token stop) noexcept = 0;
};

// Parse "bytes 0-99/1000" (total may be "*")
[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Map an HTTP status to the error it represents, empty for 2xx
[[nodiscard]] std::error_code status_to_error_code(std::int32_t status) noexcept;

} // namespace shelf::core
