// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/http_transport.hpp>
#include <charconv>

namespace shelf::core {

namespace {

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<std::uint64_t> ResponseHead::content_length() const noexcept {
    auto it = headers.find("content-length");
    if (it == headers.end()) {
        return std::nullopt;
    }
    return parse_u64(it->second);
}

std::optional<ContentRange> ResponseHead::content_range() const noexcept {
    auto it = headers.find("content-range");
    if (it == headers.end()) {
        return std::nullopt;
    }
    return parse_content_range(it->second);
}

std::optional<std::uint64_t> ResponseHead::retry_after_seconds() const noexcept {
    auto it = headers.find("retry-after");
    if (it == headers.end()) {
        return std::nullopt;
    }
    // HTTP-date form is not honoured, only delta-seconds
    return parse_u64(it->second);
}

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    constexpr std::string_view prefix = "bytes ";
    if (!value.starts_with(prefix)) {
        return std::nullopt;
    }
    value.remove_prefix(prefix.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto first = parse_u64(value.substr(0, dash));
    auto last = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range;
    range.first = *first;
    range.last = *last;

    auto total_text = value.substr(slash + 1);
    if (total_text != "*") {
        range.total = parse_u64(total_text);
        if (!range.total) {
            return std::nullopt;
        }
    }
    return range;
}

std::error_code status_to_error_code(std::int32_t status) noexcept {
    if (status >= 200 && status < 300) {
        return {};
    }
    if (status == 404 || status == 410) {
        return make_error_code(DownloadErrc::not_found);
    }
    if (status == 416) {
        return make_error_code(DownloadErrc::range_not_satisfiable);
    }
    if (status == 429) {
        return make_error_code(DownloadErrc::rate_limited);
    }
    if (status == 408) {
        return make_error_code(DownloadErrc::timeout);
    }
    if (status >= 500) {
        return make_error_code(DownloadErrc::server_error);
    }
    if (status >= 300 && status < 400) {
        // Redirects are followed by the transport; one left over is a dead end
        return make_error_code(DownloadErrc::too_many_redirects);
    }
    return make_error_code(DownloadErrc::http_client_error);
}

} // namespace shelf::core
