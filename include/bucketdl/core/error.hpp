// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace bucketdl::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    connection_lost,
    server_error,
    throttled,
    ssl_error,
    too_many_redirects,
    not_found,
    permission_denied,
    authentication_failed,
    invalid_range,
    checksum_mismatch,
    size_mismatch,
    cancelled,
    corrupt_state,
    invalid_listing,
    invalid_argument,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "bucketdl::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:               return "Success";
            case DownloadErrc::network_error:         return "Network error";
            case DownloadErrc::timeout:               return "Operation timed out";
            case DownloadErrc::refused:               return "Connection refused";
            case DownloadErrc::dns_error:             return "DNS resolution failed";
            case DownloadErrc::connection_lost:       return "Connection lost";
            case DownloadErrc::server_error:          return "Server error (5xx)";
            case DownloadErrc::throttled:             return "Request throttled by server";
            case DownloadErrc::ssl_error:             return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:    return "Too many redirects";
            case DownloadErrc::not_found:             return "Object not found (404)";
            case DownloadErrc::permission_denied:     return "Permission denied (403)";
            case DownloadErrc::authentication_failed: return "Authentication failed";
            case DownloadErrc::invalid_range:         return "Invalid byte range";
            case DownloadErrc::checksum_mismatch:     return "Checksum mismatch";
            case DownloadErrc::size_mismatch:         return "Downloaded size does not match object size";
            case DownloadErrc::cancelled:             return "Download cancelled";
            case DownloadErrc::corrupt_state:         return "Progress state is corrupt";
            case DownloadErrc::invalid_listing:       return "Invalid object listing";
            case DownloadErrc::invalid_argument:      return "Invalid argument";
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

} // namespace bucketdl::core

namespace std {

template<>
struct is_error_code_enum<bucketdl::core::DownloadErrc> : true_type {};

} // namespace std
