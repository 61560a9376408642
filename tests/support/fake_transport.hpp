// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/core/http_transport.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace shelf::test {

// In-memory HTTP server for the transfer and queue tests.
// Bodies are delivered in small pieces so chunking and stop checks run.
class FakeTransport final : public core::HttpTransport {
public:
    struct Resource {
        std::string body;
        bool honour_ranges{true};
        bool send_length{true};
        std::int32_t status{200};                 // anything but 200 is answered without a body
        std::optional<std::uint64_t> retry_after;
        // The next `failures` fetches break with `fail_with` after `fail_after` body bytes
        std::uint32_t failures{0};
        std::error_code fail_with;
        std::size_t fail_after{0};
        // Delivery blocks once the body position reaches this offset, until released or stopped
        std::optional<std::uint64_t> hold_at;
        // Only release() ends the hold, like a read stuck in the socket
        bool hold_ignores_stop{false};
        // Runs after the whole body went to the handler
        std::function<void()> after_body;
        std::uint64_t bytes_served{0};
        bool waiting{false};
    };

    explicit FakeTransport(std::size_t piece_size = 64)
        : piece_size_(piece_size) {}

    Resource& serve(const std::string& url, std::string body) {
        std::lock_guard lock(mutex_);
        auto& resource = resources_[url];
        resource.body = std::move(body);
        return resource;
    }

    // Change a resource under the transport's lock
    template<typename F>
    void configure(const std::string& url, F&& change) {
        std::lock_guard lock(mutex_);
        change(resources_[url]);
        cv_.notify_all();
    }

    void hold(const std::string& url, std::uint64_t offset) {
        configure(url, [offset](Resource& r) { r.hold_at = offset; });
    }

    void release(const std::string& url) {
        configure(url, [](Resource& r) { r.hold_at.reset(); });
    }

    // True once a fetch of `url` is blocked at its hold offset
    bool wait_held(const std::string& url, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return resources_[url].waiting; });
    }

    [[nodiscard]] std::vector<core::FetchRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count(const std::string& url) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(),
            [&](const core::FetchRequest& r) { return r.url == url; }));
    }

    [[nodiscard]] std::uint64_t bytes_served(const std::string& url) const {
        std::lock_guard lock(mutex_);
        auto it = resources_.find(url);
        return it == resources_.end() ? 0 : it->second.bytes_served;
    }

    std::error_code fetch(const core::FetchRequest& request,
                          core::FetchHandler& handler,
                          std::stop_token stop) noexcept override {
        std::unique_lock lock(mutex_);
        requests_.push_back(request);

        auto it = resources_.find(request.url);
        if (it == resources_.end()) {
            lock.unlock();
            core::ResponseHead head;
            head.status_code = 404;
            handler.on_head(head);
            return {};
        }
        auto& resource = it->second;

        if (stop.stop_requested()) {
            return make_error_code(core::DownloadErrc::cancelled);
        }

        core::ResponseHead head;
        if (resource.status != 200) {
            head.status_code = resource.status;
            if (resource.retry_after) {
                head.headers["retry-after"] = std::to_string(*resource.retry_after);
            }
            lock.unlock();
            handler.on_head(head);
            return {};
        }

        const std::uint64_t size = resource.body.size();
        std::uint64_t start = 0;
        if (request.range_start && resource.honour_ranges) {
            if (*request.range_start >= size && size > 0) {
                head.status_code = 416;
                head.headers["content-range"] = "bytes */" + std::to_string(size);
                lock.unlock();
                handler.on_head(head);
                return {};
            }
            start = *request.range_start;
            head.status_code = 206;
            head.headers["content-range"] = "bytes " + std::to_string(start) + "-"
                + std::to_string(size == 0 ? 0 : size - 1) + "/" + std::to_string(size);
        } else {
            head.status_code = 200;
        }
        if (resource.send_length) {
            head.headers["content-length"] = std::to_string(size - start);
        }

        std::optional<std::size_t> fail_at;
        std::error_code fail_with;
        if (resource.failures > 0) {
            --resource.failures;
            fail_at = static_cast<std::size_t>(start) + resource.fail_after;
            fail_with = resource.fail_with;
        }
        const std::string body = resource.body;
        auto after_body = resource.after_body;

        lock.unlock();
        if (!handler.on_head(head)) {
            return make_error_code(core::DownloadErrc::cancelled);
        }

        std::size_t pos = static_cast<std::size_t>(start);
        while (pos < body.size()) {
            if (fail_at && pos >= *fail_at) {
                return fail_with;
            }
            if (auto ec = wait_for_release(request.url, pos, stop)) {
                return ec;
            }

            std::size_t n = std::min(piece_size_, body.size() - pos);
            if (fail_at) {
                n = std::min(n, *fail_at - pos);
            }
            auto piece = std::as_bytes(std::span<const char>(body.data() + pos, n));
            {
                std::lock_guard guard(mutex_);
                resources_[request.url].bytes_served += n;
            }
            if (!handler.on_body(piece)) {
                return make_error_code(core::DownloadErrc::cancelled);
            }
            pos += n;
        }
        if (fail_at && pos >= *fail_at && pos < body.size()) {
            return fail_with;
        }
        if (after_body) {
            after_body();
        }
        return {};
    }

private:
    std::error_code wait_for_release(const std::string& url, std::uint64_t pos, std::stop_token stop) {
        std::unique_lock lock(mutex_);
        auto& resource = resources_[url];
        auto blocked = [&] { return resource.hold_at && pos >= *resource.hold_at; };
        if (!blocked()) {
            return {};
        }

        resource.waiting = true;
        cv_.notify_all();
        bool released = true;
        if (resource.hold_ignores_stop) {
            cv_.wait(lock, [&] { return !blocked(); });
        } else {
            released = cv_.wait(lock, stop, [&] { return !blocked(); });
        }
        resource.waiting = false;
        cv_.notify_all();
        if (!released) {
            return make_error_code(core::DownloadErrc::cancelled);
        }
        return {};
    }

    std::size_t piece_size_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<std::string, Resource> resources_;
    std::vector<core::FetchRequest> requests_;
};

} // namespace shelf::test
