// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/error.hpp>
#include <bucketdl/core/integrity.hpp>
#include <bucketdl/core/progress_store.hpp>
#include <bucketdl/core/remote_object.hpp>
#include <bucketdl/core/retry.hpp>
#include <bucketdl/core/transport.hpp>
#include <bucketdl/disk/file_writer.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <random>
#include <stop_token>
#include <string>

namespace bucketdl::core {

enum class VerificationResult : std::uint8_t {
    passed,
    failed,
    skipped    // Verification disabled or no usable checksum
};

[[nodiscard]] std::string_view to_string(VerificationResult result) noexcept;

// Structured lifecycle events; presentation is left to the receiver
enum class EventKind : std::uint8_t {
    status_changed,
    bytes_progressed,
    verification_result,
    retry_scheduled
};

struct TransferEvent {
    EventKind kind{EventKind::status_changed};
    std::string key;
    TransferStatus status{TransferStatus::pending};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t expected_size{0};
    std::uint64_t delta{0};                  // New bytes since the last bytes_progressed
    std::uint32_t attempt{0};
    VerificationResult verification{VerificationResult::skipped};
    std::error_code error;
    std::chrono::milliseconds retry_delay{0};
};

// May be called from several worker threads
using EventSink = std::function<void(const TransferEvent&)>;

struct WorkerOptions {
    RetryPolicy retry;
    bool verify{true};
};

// Result of one object's transfer
struct TransferOutcome {
    TransferState state;
    std::error_code error;                   // Set when state.status == failed
    std::uint64_t bytes_transferred{0};      // Received over the network by this call
    bool interrupted{false};                 // Stopped early; state persisted as pending
};

// Part file path for a target: "<target>.part"
[[nodiscard]] std::filesystem::path part_path(const std::filesystem::path& target);

// Downloads one object to completion: streaming into "<target>.part",
// resuming at byte level, verifying, then renaming onto the target.
// Every status transition is persisted to the store before continuing.
// One worker serves one thread; a thread processes objects one at a time.
class TransferWorker {
public:
    TransferWorker(Transport& transport, ProgressStore& store,
                   WorkerOptions options, EventSink sink = {});

    // Non-copyable, non-movable
    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    // state carries the resume offset decided by the orchestrator
    [[nodiscard]] TransferOutcome run(const RemoteObject& object,
                                      const std::filesystem::path& target,
                                      TransferState state,
                                      std::stop_token stop) noexcept;

private:
    struct Job;

    [[nodiscard]] std::error_code attempt_once(Job& job) noexcept;
    [[nodiscard]] std::error_code stream(Job& job, disk::FileWriter& writer) noexcept;
    [[nodiscard]] std::error_code verify_part(Job& job) noexcept;
    [[nodiscard]] std::error_code transition(Job& job, TransferStatus status) noexcept;

    void interrupt(Job& job) noexcept;
    void emit(const TransferEvent& event) noexcept;

    Transport& transport_;
    ProgressStore& store_;
    WorkerOptions options_;
    EventSink sink_;
    std::mt19937_64 rng_;
};

} // namespace bucketdl::core
