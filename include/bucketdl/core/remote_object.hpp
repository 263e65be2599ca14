// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bucketdl::core {

// One downloadable item as listed by the bucket
struct RemoteObject {
    std::string key;
    std::uint64_t size{0};
    std::chrono::system_clock::time_point last_modified{};
    std::string etag;
};

// Per-object transfer state machine
enum class TransferStatus : std::uint8_t {
    pending,      // Queued or interrupted (resumable)
    in_progress,  // Bytes are streaming
    verifying,    // Stream complete, checking digest
    completed,    // Verified and moved into place
    failed,       // Gave up
    skipped       // Already completed by an earlier run
};

[[nodiscard]] std::string_view to_string(TransferStatus status) noexcept;
[[nodiscard]] std::optional<TransferStatus> status_from_string(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_terminal(TransferStatus status) noexcept {
    return status == TransferStatus::completed
        || status == TransferStatus::failed
        || status == TransferStatus::skipped;
}

// Mutable record for one object, persisted on every status change
struct TransferState {
    std::string key;
    TransferStatus status{TransferStatus::pending};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t expected_size{0};
    std::uint32_t attempt{0};
    std::string checksum;                 // Normalized etag the bytes belong to
    std::optional<std::string> last_error;

    // Same remote content as when this record was written
    [[nodiscard]] bool matches(const RemoteObject& obj, std::string_view normalized_checksum) const noexcept {
        return expected_size == obj.size && checksum == normalized_checksum;
    }
};

using StateMap = std::map<std::string, TransferState, std::less<>>;

} // namespace bucketdl::core
