// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/config.hpp>
#include <bucketdl/core/error.hpp>
#include <bucketdl/core/progress_store.hpp>
#include <bucketdl/core/remote_object.hpp>
#include <bucketdl/core/transfer_worker.hpp>
#include <bucketdl/core/transport.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace bucketdl::core {

// Run configuration
struct EngineConfig {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};    // Clamped to 1..MAX_CONCURRENCY
    std::uint32_t retry_limit{RETRY_COUNT};
    bool verify{true};
    bool resume{true};                                 // false: discard stored progress first
    bool dry_run{false};
    std::filesystem::path output_root;
    std::string source_prefix;                         // Stripped from keys for local paths
    std::string source;                                // Run identity naming the progress file
    std::chrono::milliseconds base_delay{RETRY_BASE_DELAY};
    std::chrono::milliseconds max_delay{RETRY_MAX_DELAY};
    double jitter{RETRY_JITTER};
    std::uint32_t disk_error_abort_threshold{DISK_ERROR_ABORT_THRESHOLD};
    std::uint32_t transport_failure_abort_threshold{TRANSPORT_FAILURE_ABORT_THRESHOLD};
};

struct ObjectFailure {
    std::string key;
    std::error_code error;
    std::string message;
};

// Aggregated result of a run
struct Summary {
    std::uint64_t total_objects{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t skipped{0};
    std::uint64_t pending{0};              // Never reached a terminal state
    std::uint64_t bytes_transferred{0};
    std::chrono::milliseconds duration{0};
    bool cancelled{false};
    bool dry_run{false};
    std::error_code abort_error;           // Why the run stopped early, if it did
    std::vector<ObjectFailure> failures;   // Sorted by key
    std::vector<std::string> planned;      // Dry run: keys that would be fetched
};

enum class RunOutcome : std::uint8_t {
    success,
    auth_failure,
    network_error,
    not_found,
    partial_failure,
    user_cancelled
};

[[nodiscard]] RunOutcome classify(const Summary& summary) noexcept;
[[nodiscard]] int exit_code(RunOutcome outcome) noexcept;
[[nodiscard]] std::string_view to_string(RunOutcome outcome) noexcept;

// One object scheduled for transfer
struct PlannedTransfer {
    RemoteObject object;
    std::filesystem::path target;
    TransferState state;           // Carries the resume offset
};

struct Partition {
    std::vector<PlannedTransfer> pending;
    std::vector<std::string> skipped;
    std::vector<ObjectFailure> rejected;   // Keys with no safe local path
};

// Split objects into work, already-done and unsafe sets against stored
// records. Duplicate keys are dropped after the first occurrence; a later
// key resolving to a local file already claimed is rejected.
[[nodiscard]] Partition partition(std::span<const RemoteObject> objects,
                                  const StateMap& records,
                                  const EngineConfig& config);

using EventCallback = std::function<void(const TransferEvent&)>;

// Orchestrates a bounded pool of transfer workers over a list of objects.
//
// Objects already completed by an earlier run are skipped, interrupted ones
// resume from their last persisted byte, and per-object failures never stop
// the others. The run aborts early on an authentication failure, repeated
// disk failures, or an unreachable endpoint.
class DownloadEngine {
public:
    DownloadEngine(Transport& transport, EngineConfig config);
    ~DownloadEngine();

    // Non-copyable, non-movable (workers hold this)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) noexcept = delete;
    DownloadEngine& operator=(DownloadEngine&&) noexcept = delete;

    // Blocks until every object is terminal, the run is cancelled, or it aborts.
    // Errors are reserved for state the run cannot start from.
    [[nodiscard]] std::expected<Summary, std::error_code>
    run(std::span<const RemoteObject> objects, std::stop_token stop = {}) noexcept;

    // Stop dispatching and interrupt in-flight transfers (thread-safe)
    void cancel() noexcept;

    // Live snapshot of the summary being built (thread-safe)
    [[nodiscard]] Summary progress() const;

    // Set event callback (thread-safe)
    void callback(EventCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::filesystem::path store_path() const;

private:
    [[nodiscard]] std::expected<StateMap, std::error_code> load_records(ProgressStore& store) noexcept;
    [[nodiscard]] Summary dry_run(std::span<const RemoteObject> objects);

    void worker_loop(std::stop_token stop) noexcept;
    void finish_object(const PlannedTransfer& item, const TransferOutcome& outcome) noexcept;
    void abort_locked(std::error_code ec) noexcept;
    void on_event(const TransferEvent& event) noexcept;

    Transport& transport_;
    EngineConfig config_;
    std::unique_ptr<ProgressStore> store_;

    std::deque<PlannedTransfer> queue_;
    Summary summary_;
    std::chrono::steady_clock::time_point start_time_;
    std::uint32_t disk_failures_{0};
    std::uint32_t consecutive_unreachable_{0};
    std::stop_source stop_source_;
    mutable std::mutex mutex_;             // Protects queue_, summary_ and the counters

    EventCallback callback_;
    std::mutex callback_mutex_;            // Protects callback_ access
};

} // namespace bucketdl::core
