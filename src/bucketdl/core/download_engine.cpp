// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/download_engine.hpp>
#include <bucketdl/core/integrity.hpp>
#include <bucketdl/core/retry.hpp>
#include <bucketdl/disk/file_writer.hpp>
#include <bucketdl/disk/safe_path.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <new>
#include <set>
#include <thread>

namespace bucketdl::core {

namespace fs = std::filesystem;

namespace {

bool target_complete(const fs::path& target, std::uint64_t size) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        return false;
    }
    return disk::file_size_or_zero(target) == size;
}

TransferEvent status_event(const std::string& key, TransferStatus status, std::error_code error = {}) {
    TransferEvent event;
    event.kind = EventKind::status_changed;
    event.key = key;
    event.status = status;
    event.error = error;
    return event;
}

void sort_failures(std::vector<ObjectFailure>& failures) {
    std::sort(failures.begin(), failures.end(),
              [](const ObjectFailure& a, const ObjectFailure& b) { return a.key < b.key; });
}

} // namespace

//=============================================================================
// Exit classification
//=============================================================================

RunOutcome classify(const Summary& summary) noexcept {
    if (summary.cancelled) {
        return RunOutcome::user_cancelled;
    }
    if (summary.abort_error == DownloadErrc::authentication_failed) {
        return RunOutcome::auth_failure;
    }
    if (summary.failures.empty()) {
        return RunOutcome::success;
    }
    if (summary.dry_run) {
        // A plan makes no requests; its only failures are rejected keys
        return RunOutcome::partial_failure;
    }

    if (summary.completed + summary.skipped == 0) {
        bool any_auth = false;
        bool all_not_found = true;
        for (const auto& f : summary.failures) {
            any_auth = any_auth || f.error == DownloadErrc::authentication_failed;
            all_not_found = all_not_found && f.error == DownloadErrc::not_found;
        }
        if (any_auth) return RunOutcome::auth_failure;
        if (all_not_found) return RunOutcome::not_found;
        return RunOutcome::network_error;
    }
    return RunOutcome::partial_failure;
}

int exit_code(RunOutcome outcome) noexcept {
    return static_cast<int>(outcome);
}

std::string_view to_string(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::success:         return "success";
        case RunOutcome::auth_failure:    return "auth_failure";
        case RunOutcome::network_error:   return "network_error";
        case RunOutcome::not_found:       return "not_found";
        case RunOutcome::partial_failure: return "partial_failure";
        case RunOutcome::user_cancelled:  return "user_cancelled";
    }
    return "unknown";
}

//=============================================================================
// Partition
//=============================================================================

Partition partition(std::span<const RemoteObject> objects,
                    const StateMap& records,
                    const EngineConfig& config) {
    Partition result;
    std::set<std::string_view> seen;
    std::set<fs::path> targets;

    for (const auto& obj : objects) {
        if (!seen.insert(obj.key).second) {
            spdlog::debug("{}: duplicate listing entry ignored", obj.key);
            continue;
        }

        auto target = disk::safe_join(config.output_root, disk::relative_key(obj.key, config.source_prefix));
        if (!target) {
            spdlog::warn("{}: rejected, {}", obj.key, target.error().message());
            result.rejected.push_back({obj.key, target.error(), target.error().message()});
            continue;
        }
        if (!targets.insert(*target).second) {
            const auto conflict = make_error_code(disk::DiskErrc::target_conflict);
            spdlog::warn("{}: rejected, {} ({})", obj.key, conflict.message(), target->string());
            result.rejected.push_back({obj.key, conflict, conflict.message()});
            continue;
        }

        PlannedTransfer planned;
        planned.object = obj;
        planned.target = std::move(*target);
        planned.state.key = obj.key;
        planned.state.expected_size = obj.size;
        planned.state.checksum = normalize_checksum(obj.etag);

        if (auto it = records.find(obj.key); it != records.end()) {
            const auto& rec = it->second;
            if (!rec.matches(obj, planned.state.checksum)) {
                spdlog::info("{}: changed since the last run, downloading again", obj.key);
            } else if (rec.status == TransferStatus::completed || rec.status == TransferStatus::skipped) {
                if (target_complete(planned.target, obj.size)) {
                    result.skipped.push_back(obj.key);
                    continue;
                }
                spdlog::info("{}: local copy missing, downloading again", obj.key);
            } else {
                planned.state.bytes_downloaded = rec.bytes_downloaded;
            }
        }

        result.pending.push_back(std::move(planned));
    }

    return result;
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(Transport& transport, EngineConfig config)
    : transport_(transport)
    , config_(std::move(config)) {
    config_.concurrency = std::clamp<std::uint32_t>(config_.concurrency, 1, MAX_CONCURRENCY);
    if (config_.source.empty()) {
        config_.source = config_.source_prefix;
    }
}

DownloadEngine::~DownloadEngine() {
    stop_source_.request_stop();
}

fs::path DownloadEngine::store_path() const {
    return ProgressStore::default_path(config_.output_root, config_.source);
}

void DownloadEngine::cancel() noexcept {
    stop_source_.request_stop();
}

Summary DownloadEngine::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Summary copy = summary_;
    if (!copy.dry_run && start_time_ != std::chrono::steady_clock::time_point{}) {
        copy.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }
    return copy;
}

std::expected<StateMap, std::error_code> DownloadEngine::load_records(ProgressStore& store) noexcept {
    auto records = store.load();
    if (records || records.error() != DownloadErrc::corrupt_state) {
        return records;
    }

    spdlog::warn("Progress file {} is unreadable, starting fresh", store.path().string());
    if (auto ec = store.reset()) {
        spdlog::error("Could not reset progress file: {}", ec.message());
        return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    }
    return StateMap{};
}

Summary DownloadEngine::dry_run(std::span<const RemoteObject> objects) {
    StateMap records;
    if (config_.resume) {
        // Read-only: a corrupt store is treated as empty and left untouched
        ProgressStore store(store_path(), config_.source);
        if (auto loaded = store.load()) {
            records = std::move(*loaded);
        } else {
            spdlog::warn("Progress file {} is unusable ({}), planning from scratch",
                         store.path().string(), loaded.error().message());
        }
    }

    auto parts = partition(objects, records, config_);

    Summary summary;
    summary.dry_run = true;
    summary.total_objects = parts.pending.size() + parts.skipped.size() + parts.rejected.size();
    summary.skipped = parts.skipped.size();
    summary.failed = parts.rejected.size();
    summary.pending = parts.pending.size();
    summary.failures = std::move(parts.rejected);
    sort_failures(summary.failures);
    summary.planned.reserve(parts.pending.size());
    for (const auto& p : parts.pending) {
        summary.planned.push_back(p.object.key);
    }
    return summary;
}

std::expected<Summary, std::error_code>
DownloadEngine::run(std::span<const RemoteObject> objects, std::stop_token stop) noexcept {
    std::stop_callback forward(stop, [this] { stop_source_.request_stop(); });

    try {
        if (config_.dry_run) {
            auto summary = dry_run(objects);
            std::lock_guard<std::mutex> lock(mutex_);
            summary_ = summary;
            return summary;
        }

        auto started = std::chrono::steady_clock::now();
        store_ = std::make_unique<ProgressStore>(store_path(), config_.source);

        if (!config_.resume) {
            if (auto ec = store_->reset()) {
                spdlog::error("Could not discard progress file: {}", ec.message());
                return std::unexpected(ec);
            }
        }

        auto records = load_records(*store_);
        if (!records) {
            return std::unexpected(records.error());
        }
        if (auto ec = store_->compact()) {
            spdlog::warn("Could not compact progress file: {}", ec.message());
        }

        auto parts = partition(objects, *records, config_);
        std::size_t worker_count = std::min<std::size_t>(config_.concurrency, parts.pending.size());

        {
            std::lock_guard<std::mutex> lock(mutex_);
            summary_ = Summary{};
            summary_.total_objects = parts.pending.size() + parts.skipped.size() + parts.rejected.size();
            summary_.skipped = parts.skipped.size();
            summary_.failed = parts.rejected.size();
            summary_.failures = parts.rejected;
            start_time_ = started;
            disk_failures_ = 0;
            consecutive_unreachable_ = 0;
            queue_.assign(std::make_move_iterator(parts.pending.begin()),
                          std::make_move_iterator(parts.pending.end()));
        }

        spdlog::info("{} object(s): {} to fetch, {} already complete, {} rejected",
                     summary_.total_objects, parts.pending.size(), parts.skipped.size(),
                     parts.rejected.size());

        for (const auto& key : parts.skipped) {
            on_event(status_event(key, TransferStatus::skipped));
        }
        for (const auto& r : parts.rejected) {
            on_event(status_event(r.key, TransferStatus::failed, r.error));
        }

        {
            std::vector<std::jthread> workers;
            workers.reserve(worker_count);
            for (std::size_t i = 0; i < worker_count; ++i) {
                workers.emplace_back([this, token = stop_source_.get_token()] { worker_loop(token); });
            }
            // jthread joins on destruction
        }

        std::lock_guard<std::mutex> lock(mutex_);
        summary_.pending += queue_.size();
        queue_.clear();
        summary_.cancelled = stop_source_.stop_requested() && !summary_.abort_error
                             && summary_.pending > 0;
        summary_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        sort_failures(summary_.failures);

        spdlog::info("Run finished: {} completed, {} skipped, {} failed, {} pending",
                     summary_.completed, summary_.skipped, summary_.failed, summary_.pending);
        return summary_;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    } catch (const std::system_error& e) {
        // Thread creation failure
        spdlog::error("Run failed: {}", e.what());
        return std::unexpected(e.code());
    }
}

void DownloadEngine::worker_loop(std::stop_token stop) noexcept {
    WorkerOptions options;
    options.retry.retry_limit = config_.retry_limit;
    options.retry.base_delay = config_.base_delay;
    options.retry.max_delay = config_.max_delay;
    options.retry.jitter = config_.jitter;
    options.verify = config_.verify;

    try {
        TransferWorker worker(transport_, *store_, options,
                              [this](const TransferEvent& event) { on_event(event); });

        while (!stop.stop_requested()) {
            PlannedTransfer item;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (queue_.empty()) {
                    break;
                }
                item = std::move(queue_.front());
                queue_.pop_front();
            }

            auto outcome = worker.run(item.object, item.target, item.state, stop);
            finish_object(item, outcome);
        }
    } catch (const std::exception& e) {
        spdlog::error("Worker stopped: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        abort_locked(std::make_error_code(std::errc::not_enough_memory));
    }
}

void DownloadEngine::finish_object(const PlannedTransfer& item, const TransferOutcome& outcome) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (outcome.interrupted) {
        ++summary_.pending;
        return;
    }
    if (!outcome.error) {
        ++summary_.completed;
        consecutive_unreachable_ = 0;
        return;
    }

    ++summary_.failed;
    try {
        summary_.failures.push_back({item.object.key, outcome.error, outcome.error.message()});
    } catch (const std::bad_alloc&) {
        spdlog::error("{}: failure not recorded in summary", item.object.key);
    }

    if (classify(outcome.error) == Verdict::fatal_run) {
        abort_locked(outcome.error);
        return;
    }
    if (is_disk_error(outcome.error) && ++disk_failures_ >= config_.disk_error_abort_threshold) {
        abort_locked(outcome.error);
        return;
    }
    if (is_transport_unavailable(outcome.error)) {
        if (++consecutive_unreachable_ >= config_.transport_failure_abort_threshold) {
            abort_locked(outcome.error);
        }
    } else {
        consecutive_unreachable_ = 0;
    }
}

void DownloadEngine::abort_locked(std::error_code ec) noexcept {
    if (!summary_.abort_error) {
        summary_.abort_error = ec;
        spdlog::error("Aborting run: {}", ec.message());
    }
    stop_source_.request_stop();
}

void DownloadEngine::on_event(const TransferEvent& event) noexcept {
    if (event.kind == EventKind::bytes_progressed) {
        std::lock_guard<std::mutex> lock(mutex_);
        summary_.bytes_transferred += event.delta;
    }

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
        try {
            callback_(event);
        } catch (const std::exception& e) {
            spdlog::error("event callback failed: {}", e.what());
        }
    }
}

} // namespace bucketdl::core
