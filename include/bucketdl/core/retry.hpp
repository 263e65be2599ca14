// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <random>
#include <system_error>

namespace bucketdl::core {

// What an attempt's error means for the object and the run
enum class Verdict : std::uint8_t {
    ok,            // No error
    retryable,     // Transient: try again after backoff
    fatal_object,  // This object is done, others continue
    fatal_run      // Stop the whole run
};

[[nodiscard]] Verdict classify(const std::error_code& ec) noexcept;

// Errors that must restart the object from byte 0 when retried
[[nodiscard]] bool requires_restart(const std::error_code& ec) noexcept;

// Disk-category failures count toward run-level escalation
[[nodiscard]] bool is_disk_error(const std::error_code& ec) noexcept;

// Endpoint unreachable (DNS, refused): repeated, it means no transport at all
[[nodiscard]] bool is_transport_unavailable(const std::error_code& ec) noexcept;

struct RetryPolicy {
    std::uint32_t retry_limit{RETRY_COUNT};           // Retries after the first attempt
    std::chrono::milliseconds base_delay{RETRY_BASE_DELAY};
    std::chrono::milliseconds max_delay{RETRY_MAX_DELAY};
    double jitter{RETRY_JITTER};

    [[nodiscard]] std::uint32_t max_attempts() const noexcept { return retry_limit + 1; }

    // attempt is 1-based and counts the attempt that just failed
    [[nodiscard]] bool should_retry(std::uint32_t attempt, const std::error_code& ec) const noexcept;

    // Delay before the attempt after `attempt`:
    // min(base * 2^(attempt-1), max) scaled by a random factor in [1-jitter, 1+jitter]
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt, std::mt19937_64& rng) const noexcept;
};

} // namespace bucketdl::core
