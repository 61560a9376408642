// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <new>

namespace shelf::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    try {
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) {
            path_start = url_str.length();
        }

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) {
            query_start = url_str.length();
        }

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }

        // Authority ends at the first of /, ?, # or end
        auto host_end = std::min({path_start, query_start, fragment_start});
        auto authority = url_str.substr(rest_start, host_end - rest_start);

        if (authority.find_first_of(" \t\r\n") != std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        // Skip userinfo (user:pass@host)
        auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            authority.remove_prefix(at_pos + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto tail = authority.substr(bracket_end + 1);
            if (!tail.empty()) {
                if (tail.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = std::string(tail.substr(1));
            }
        } else {
            auto colon_pos = authority.find(':');
            if (colon_pos != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon_pos));
                url.port_ = std::string(authority.substr(colon_pos + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    // Fragments are never sent to the server
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_;
    }
    return path_.substr(last_slash + 1);
}

} // namespace shelf::core
