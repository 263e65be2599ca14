// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <bucketdl/core/retry.hpp>
#include <bucketdl/core/error.hpp>
#include <bucketdl/disk/error.hpp>

using namespace bucketdl::core;
using bucketdl::disk::DiskErrc;

using namespace std::chrono_literals;

TEST_CASE("classify errors", "[retry]") {
    SECTION("Transient network conditions retry") {
        CHECK(classify(DownloadErrc::timeout) == Verdict::retryable);
        CHECK(classify(DownloadErrc::connection_lost) == Verdict::retryable);
        CHECK(classify(DownloadErrc::server_error) == Verdict::retryable);
        CHECK(classify(DownloadErrc::throttled) == Verdict::retryable);
        CHECK(classify(DownloadErrc::checksum_mismatch) == Verdict::retryable);
    }

    SECTION("Per-object permanent failures") {
        CHECK(classify(DownloadErrc::not_found) == Verdict::fatal_object);
        CHECK(classify(DownloadErrc::permission_denied) == Verdict::fatal_object);
        CHECK(classify(DiskErrc::disk_full) == Verdict::fatal_object);
        CHECK(classify(DiskErrc::path_traversal) == Verdict::fatal_object);
        CHECK(classify(std::make_error_code(std::errc::io_error)) == Verdict::fatal_object);
    }

    SECTION("Authentication stops the run") {
        CHECK(classify(DownloadErrc::authentication_failed) == Verdict::fatal_run);
    }

    SECTION("No error") {
        CHECK(classify(std::error_code{}) == Verdict::ok);
    }
}

TEST_CASE("error groups", "[retry]") {
    CHECK(requires_restart(DownloadErrc::checksum_mismatch));
    CHECK(requires_restart(DownloadErrc::size_mismatch));
    CHECK_FALSE(requires_restart(DownloadErrc::connection_lost));

    CHECK(is_disk_error(DiskErrc::disk_full));
    CHECK_FALSE(is_disk_error(DiskErrc::path_traversal));
    CHECK_FALSE(is_disk_error(DiskErrc::target_conflict));
    CHECK_FALSE(is_disk_error(DownloadErrc::timeout));

    CHECK(is_transport_unavailable(DownloadErrc::dns_error));
    CHECK(is_transport_unavailable(DownloadErrc::refused));
    CHECK_FALSE(is_transport_unavailable(DownloadErrc::timeout));
}

TEST_CASE("RetryPolicy::should_retry", "[retry]") {
    RetryPolicy policy;
    policy.retry_limit = 2;
    const std::error_code transient = DownloadErrc::timeout;

    CHECK(policy.max_attempts() == 3);
    CHECK(policy.should_retry(1, transient));
    CHECK(policy.should_retry(2, transient));
    CHECK_FALSE(policy.should_retry(3, transient));
    CHECK_FALSE(policy.should_retry(1, DownloadErrc::not_found));

    SECTION("Zero retries means one attempt") {
        policy.retry_limit = 0;
        CHECK_FALSE(policy.should_retry(1, transient));
    }
}

TEST_CASE("RetryPolicy::backoff", "[retry]") {
    RetryPolicy policy;
    policy.base_delay = 100ms;
    policy.max_delay = 1000ms;
    std::mt19937_64 rng(42);

    SECTION("Doubles without jitter") {
        policy.jitter = 0.0;
        CHECK(policy.backoff(1, rng) == 100ms);
        CHECK(policy.backoff(2, rng) == 200ms);
        CHECK(policy.backoff(3, rng) == 400ms);
    }

    SECTION("Capped at the maximum") {
        policy.jitter = 0.0;
        CHECK(policy.backoff(10, rng) == 1000ms);
        CHECK(policy.backoff(200, rng) == 1000ms);
    }

    SECTION("Jitter stays within bounds") {
        policy.jitter = 0.5;
        for (int i = 0; i < 100; ++i) {
            auto d = policy.backoff(2, rng);
            CHECK(d >= 100ms);
            CHECK(d <= 300ms);
        }
    }
}
