// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace bucketdl::core {

enum class ChecksumAlgorithm : std::uint8_t {
    none,    // Not verifiable (e.g. multipart ETag)
    md5,
    sha1,
    sha256
};

[[nodiscard]] std::string_view to_string(ChecksumAlgorithm algorithm) noexcept;

// Strip surrounding quotes and lowercase ("\"ABC\"" -> "abc")
[[nodiscard]] std::string normalize_checksum(std::string_view etag);

// Pick the digest from a normalized checksum by its hex length.
// Multipart ETags ("<hex>-<parts>") and anything unrecognized map to none.
[[nodiscard]] ChecksumAlgorithm detect_algorithm(std::string_view checksum) noexcept;

// Lowercase hex digest of a file, streamed in VERIFY_CHUNK_SIZE pieces
[[nodiscard]] std::expected<std::string, std::error_code>
digest(const std::filesystem::path& path, ChecksumAlgorithm algorithm) noexcept;

// Lowercase hex digest of an in-memory buffer
[[nodiscard]] std::expected<std::string, std::error_code>
digest_bytes(std::string_view data, ChecksumAlgorithm algorithm) noexcept;

// Compare a file against its expected checksum.
// A mismatch is false, not an error; errors are I/O or digest failures.
[[nodiscard]] std::expected<bool, std::error_code>
verify(const std::filesystem::path& path,
       std::string_view expected_checksum,
       ChecksumAlgorithm algorithm) noexcept;

} // namespace bucketdl::core
