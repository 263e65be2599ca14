// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/retry.hpp>
#include <bucketdl/core/error.hpp>
#include <bucketdl/disk/error.hpp>
#include <algorithm>
#include <cmath>

namespace bucketdl::core {

Verdict classify(const std::error_code& ec) noexcept {
    if (!ec) {
        return Verdict::ok;
    }
    if (ec.category() == disk::disk_errc_category()) {
        return Verdict::fatal_object;
    }
    if (ec.category() != download_errc_category()) {
        // Foreign categories (std::generic_category from the filesystem library)
        return Verdict::fatal_object;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::refused:
        case DownloadErrc::dns_error:
        case DownloadErrc::connection_lost:
        case DownloadErrc::server_error:
        case DownloadErrc::throttled:
        case DownloadErrc::invalid_range:
        case DownloadErrc::checksum_mismatch:
        case DownloadErrc::size_mismatch:
            return Verdict::retryable;

        case DownloadErrc::authentication_failed:
            return Verdict::fatal_run;

        default:
            return Verdict::fatal_object;
    }
}

bool requires_restart(const std::error_code& ec) noexcept {
    return ec == DownloadErrc::checksum_mismatch
        || ec == DownloadErrc::size_mismatch
        || ec == DownloadErrc::invalid_range;
}

bool is_disk_error(const std::error_code& ec) noexcept {
    return ec && ec.category() == disk::disk_errc_category()
        && ec != disk::DiskErrc::path_traversal
        && ec != disk::DiskErrc::target_conflict;
}

bool is_transport_unavailable(const std::error_code& ec) noexcept {
    return ec == DownloadErrc::dns_error || ec == DownloadErrc::refused;
}

bool RetryPolicy::should_retry(std::uint32_t attempt, const std::error_code& ec) const noexcept {
    return classify(ec) == Verdict::retryable && attempt < max_attempts();
}

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t attempt, std::mt19937_64& rng) const noexcept {
    using rep = std::chrono::milliseconds::rep;

    const std::uint32_t exponent = std::min<std::uint32_t>(attempt > 0 ? attempt - 1 : 0, 30);
    const double raw = static_cast<double>(base_delay.count()) * std::ldexp(1.0, static_cast<int>(exponent));
    const double capped = std::min(raw, static_cast<double>(max_delay.count()));

    const double spread = std::clamp(jitter, 0.0, 1.0);
    std::uniform_real_distribution<double> dist(1.0 - spread, 1.0 + spread);
    const double scaled = capped * dist(rng);

    return std::chrono::milliseconds{static_cast<rep>(std::max(0.0, std::round(scaled)))};
}

} // namespace bucketdl::core
