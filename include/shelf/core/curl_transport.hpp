// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/config.hpp>
#include <shelf/core/http_transport.hpp>
#include <cstdint>
#include <string>

namespace shelf::core {

struct CurlOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    std::string user_agent;   // empty selects "shelf/<version>"
    bool verify_tls{true};
};

// libcurl-backed transport; one easy handle per fetch, safe to share between workers
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlOptions options = {});

    [[nodiscard]] std::error_code fetch(const FetchRequest& request,
                                        FetchHandler& handler,
                                        std::stop_token stop) noexcept override;

    // Global initialization (call once at startup, before any worker runs)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    CurlOptions options_;
};

} // namespace shelf::core
