// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/error.hpp>
#include <bucketdl/core/http_session.hpp>
#include <bucketdl/core/remote_object.hpp>
#include <chrono>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bucketdl::core {

// Parse a listing document:
//   {"objects": [{"key": "...", "size": 123, "etag": "...",
//                 "last_modified": "2024-03-01T12:00:00Z"}, ...]}
// "etag" and "last_modified" are optional. Malformed documents yield
// DownloadErrc::invalid_listing.
[[nodiscard]] std::expected<std::vector<RemoteObject>, std::error_code>
parse_listing(std::string_view text) noexcept;

// Load a listing from a local file or, for http(s) locations, through session
[[nodiscard]] std::expected<std::vector<RemoteObject>, std::error_code>
load_listing(std::string_view location, HttpSession& session) noexcept;

// ISO-8601 UTC timestamp ("YYYY-MM-DDTHH:MM:SS[.fff][Z|+00:00]")
[[nodiscard]] std::expected<std::chrono::system_clock::time_point, std::error_code>
parse_timestamp(std::string_view text) noexcept;

// "data/2024" -> "data/2024/"; "" stays "" (whole bucket)
[[nodiscard]] std::string normalize_prefix(std::string_view path);

// Objects whose key starts with prefix, excluding the prefix's own marker object
[[nodiscard]] std::vector<RemoteObject> under_prefix(std::span<const RemoteObject> objects,
                                                     std::string_view prefix);

// One level of the key hierarchy below a prefix
struct DirectoryContents {
    std::vector<std::string> folders;   // Sorted, without trailing '/'
    std::vector<std::string> files;     // Sorted, relative to the prefix
};

[[nodiscard]] DirectoryContents list_contents(std::span<const RemoteObject> objects,
                                              std::string_view prefix);

} // namespace bucketdl::core
