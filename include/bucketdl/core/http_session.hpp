// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/error.hpp>
#include <bucketdl/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace bucketdl::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lowercased names
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string etag;
    std::string last_modified;
    std::string content_type;
};

// libcurl transport against a bucket exposed over HTTP(S).
// Objects live at "<endpoint>/<key>"; a non-empty token is sent as
// "Authorization: Bearer <token>". Each request uses its own easy handle,
// so one session can serve all workers concurrently.
class HttpSession final : public Transport {
public:
    explicit HttpSession(std::string endpoint, std::string token = {});

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    [[nodiscard]] std::expected<ObjectInfo, std::error_code>
    head_object(std::string_view key) noexcept override;

    [[nodiscard]] std::expected<RangeResult, std::error_code>
    get_object_range(std::string_view key,
                     std::uint64_t start_byte,
                     const RangeSink& sink,
                     std::stop_token stop) noexcept override;

    // GET a small document (object listings) into memory
    [[nodiscard]] std::expected<std::string, std::error_code>
    fetch(const std::string& url) noexcept;

    // Perform HEAD request and return the raw response
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept;

    [[nodiscard]] std::string object_url(std::string_view key) const;
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

    // Percent-encode everything but RFC 3986 unreserved characters and '/'
    [[nodiscard]] static std::string escape_key(std::string_view key);

    [[nodiscard]] static std::error_code status_to_error(long http_code) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string endpoint_;
    std::string token_;
};

} // namespace bucketdl::core
