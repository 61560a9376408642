// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/curl_transport.hpp>
#include <shelf/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <memory>
#include <string>
#include <utility>

namespace shelf::core {

namespace {

constexpr long CURL_BUFFER_SIZE = 256 * 1024;  // 256 KB

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(std::exchange(other.ptr, nullptr)) {}
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = std::exchange(other.ptr, nullptr);
        }
        return *this;
    }
};

// State shared with the libcurl callbacks of one fetch
struct FetchContext {
    FetchHandler& handler;
    std::stop_token stop;
    CURL* curl{nullptr};
    ResponseHead head;
    bool head_delivered{false};
    bool aborted{false};

    bool deliver_head() {
        if (head_delivered) {
            return !aborted;
        }
        head_delivered = true;

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        head.status_code = static_cast<std::int32_t>(http_code);

        if (!handler.on_head(head)) {
            aborted = true;
        }
        return !aborted;
    }
};

// Header callback; a new status line starts a new response (redirects)
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<FetchContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        ctx->head.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    ctx->head.headers[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!ctx->deliver_head()) {
        return 0;
    }

    auto data = std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), bytes);
    if (!ctx->handler.on_body(data)) {
        ctx->aborted = true;
        return 0;
    }
    return bytes;
}

// Aborts the transfer once a stop was requested, also while no data flows
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RANGE_ERROR:
            return make_error_code(DownloadErrc::range_not_satisfiable);
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        default:
            return make_error_code(DownloadErrc::connection_lost);
    }
}

} // namespace

//=============================================================================
// CurlTransport
//=============================================================================

CurlTransport::CurlTransport(CurlOptions options)
    : options_(std::move(options)) {
    if (options_.user_agent.empty()) {
        options_.user_agent = "shelf/" + shelf::version.to_string();
    }
}

std::error_code CurlTransport::fetch(const FetchRequest& request,
                                     FetchHandler& handler,
                                     std::stop_token stop) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::make_error_code(std::errc::not_enough_memory);
        }

        FetchContext ctx{handler, stop, curl.ptr};

        curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());

        std::string range;
        if (request.range_start) {
            range = std::to_string(*request.range_start) + "-";
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(options_.max_redirects));
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, options_.user_agent.c_str());

        // HTTP/2
        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, CURL_BUFFER_SIZE);
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);

        if (ctx.aborted || result == CURLE_ABORTED_BY_CALLBACK) {
            return make_error_code(DownloadErrc::cancelled);
        }

        if (result != CURLE_OK) {
            spdlog::debug("curl error {} on {}: {}", static_cast<int>(result), request.url,
                          curl_easy_strerror(result));
            return curl_to_error_code(result);
        }

        // Responses without a body never reached the write callback
        if (!ctx.deliver_head()) {
            return make_error_code(DownloadErrc::cancelled);
        }

        return {};
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace shelf::core
