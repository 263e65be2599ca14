// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace bucketdl::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 4;
constexpr std::uint32_t MAX_CONCURRENCY = 32;
constexpr std::uint32_t RETRY_COUNT = 3;                           // Retries after the first attempt

constexpr std::chrono::milliseconds RETRY_BASE_DELAY{1000};
constexpr std::chrono::milliseconds RETRY_MAX_DELAY{60'000};
constexpr double RETRY_JITTER = 0.5;                                // +/- fraction of the delay

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;                     // Abort below 1 B/s for this long

constexpr std::uint64_t PROGRESS_REPORT_BYTES = 4 * 1024 * 1024;    // 4 MB
constexpr std::chrono::milliseconds PROGRESS_REPORT_INTERVAL{1000};

constexpr std::size_t PROGRESS_COMPACT_THRESHOLD = 1024;         // Journal lines before folding into the snapshot

constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KB
constexpr std::size_t VERIFY_CHUNK_SIZE = 1024 * 1024;              // 1 MB

constexpr std::uint32_t DISK_ERROR_ABORT_THRESHOLD = 2;
constexpr std::uint32_t TRANSPORT_FAILURE_ABORT_THRESHOLD = 3;

constexpr std::uint64_t LARGE_DOWNLOAD_THRESHOLD = 100 * 1024 * 1024;  // Confirm above 100 MB

constexpr std::uint32_t MAX_REDIRECTS = 10;

} // namespace bucketdl::core
