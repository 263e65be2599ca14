// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace bucketdl::core {

// Metadata from a HEAD on one object
struct ObjectInfo {
    std::uint64_t size{0};
    std::string checksum;       // Raw ETag
    std::string last_modified;  // HTTP date as sent by the server
    bool accepts_ranges{false};
};

// Receiver for a ranged fetch.
// begin() is called once with the offset the server actually honored
// (0 when it ignored the range), then write() per chunk. Returning an
// error from either aborts the transfer with that error.
struct RangeSink {
    std::function<std::error_code(std::uint64_t start_offset)> begin;
    std::function<std::error_code(const char* data, std::size_t size)> write;
};

struct RangeResult {
    std::uint64_t start_offset{0};   // Offset the body started at
    std::uint64_t bytes_received{0};
};

// Authenticated access to a bucket. Implementations must be safe to call
// from several worker threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<ObjectInfo, std::error_code>
    head_object(std::string_view key) noexcept = 0;

    // Stream the object from start_byte to its end into sink.
    // Stops with DownloadErrc::cancelled once stop is requested.
    [[nodiscard]] virtual std::expected<RangeResult, std::error_code>
    get_object_range(std::string_view key,
                     std::uint64_t start_byte,
                     const RangeSink& sink,
                     std::stop_token stop) noexcept = 0;
};

} // namespace bucketdl::core
