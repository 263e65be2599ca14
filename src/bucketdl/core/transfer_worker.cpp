// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/transfer_worker.hpp>
#include <bucketdl/core/config.hpp>
#include <bucketdl/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <mutex>
#include <new>
#include <utility>

namespace bucketdl::core {

namespace fs = std::filesystem;

namespace {

// Sleep for delay unless stop is requested first. Returns false if stopped.
bool wait_for_retry(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    (void)cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

std::error_code remove_part(const fs::path& part) noexcept {
    std::error_code ec;
    fs::remove(part, ec);
    return ec ? disk::errno_to_error_code(ec.value()) : std::error_code{};
}

} // namespace

std::string_view to_string(VerificationResult result) noexcept {
    switch (result) {
        case VerificationResult::passed:  return "passed";
        case VerificationResult::failed:  return "failed";
        case VerificationResult::skipped: return "skipped";
    }
    return "unknown";
}

fs::path part_path(const fs::path& target) {
    fs::path part = target;
    part += ".part";
    return part;
}

// Per-call transfer context
struct TransferWorker::Job {
    const RemoteObject& object;
    fs::path target;
    fs::path part;
    TransferState state;
    ChecksumAlgorithm algorithm{ChecksumAlgorithm::none};
    std::stop_token stop;
    std::uint64_t bytes_transferred{0};
};

//=============================================================================
// TransferWorker
//=============================================================================

TransferWorker::TransferWorker(Transport& transport, ProgressStore& store,
                               WorkerOptions options, EventSink sink)
    : transport_(transport)
    , store_(store)
    , options_(options)
    , sink_(std::move(sink))
    , rng_(std::random_device{}()) {}

TransferOutcome TransferWorker::run(const RemoteObject& object,
                                    const fs::path& target,
                                    TransferState state,
                                    std::stop_token stop) noexcept {
    TransferOutcome outcome;
    try {
        Job job{object, target, part_path(target), std::move(state),
                ChecksumAlgorithm::none, std::move(stop), 0};

        job.state.key = object.key;
        job.state.expected_size = object.size;
        job.state.checksum = normalize_checksum(object.etag);
        job.state.last_error.reset();
        if (options_.verify) {
            job.algorithm = detect_algorithm(job.state.checksum);
        }

        std::uint32_t attempt = 0;
        while (true) {
            if (job.stop.stop_requested()) {
                interrupt(job);
                outcome.interrupted = true;
                break;
            }

            job.state.attempt = ++attempt;
            auto ec = attempt_once(job);
            if (!ec) {
                break;
            }

            if (job.stop.stop_requested()) {
                interrupt(job);
                outcome.interrupted = true;
                break;
            }

            if (requires_restart(ec)) {
                if (auto rm = remove_part(job.part)) {
                    ec = rm;
                }
                job.state.bytes_downloaded = 0;
            }

            if (options_.retry.should_retry(attempt, ec)) {
                auto delay = options_.retry.backoff(attempt, rng_);
                spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {} ms",
                             object.key, attempt, options_.retry.max_attempts(),
                             ec.message(), delay.count());

                job.state.last_error = ec.message();
                if (auto st = transition(job, TransferStatus::pending)) {
                    ec = st;
                } else {
                    TransferEvent event;
                    event.kind = EventKind::retry_scheduled;
                    event.key = object.key;
                    event.status = TransferStatus::pending;
                    event.bytes_downloaded = job.state.bytes_downloaded;
                    event.expected_size = object.size;
                    event.attempt = attempt;
                    event.error = ec;
                    event.retry_delay = delay;
                    emit(event);

                    if (wait_for_retry(delay, job.stop)) {
                        continue;
                    }
                    interrupt(job);
                    outcome.interrupted = true;
                    break;
                }
            }

            spdlog::error("{}: failed after {} attempt(s): {}", object.key, attempt, ec.message());
            job.state.last_error = ec.message();
            if (auto st = transition(job, TransferStatus::failed)) {
                spdlog::error("{}: could not record failure: {}", object.key, st.message());
            }
            outcome.error = ec;
            break;
        }

        outcome.state = std::move(job.state);
        outcome.bytes_transferred = job.bytes_transferred;
    } catch (const std::bad_alloc&) {
        outcome.state.status = TransferStatus::failed;
        outcome.error = std::make_error_code(std::errc::not_enough_memory);
    }
    return outcome;
}

std::error_code TransferWorker::attempt_once(Job& job) noexcept {
    const auto size = job.object.size;

    // Resume only when the part file still holds every confirmed byte
    std::uint64_t offset = 0;
    const auto confirmed = job.state.bytes_downloaded;
    if (confirmed > 0 && confirmed <= size && disk::file_size_or_zero(job.part) >= confirmed) {
        offset = confirmed;
        spdlog::debug("{}: resuming at byte {} of {}", job.object.key, offset, size);
    }
    job.state.bytes_downloaded = offset;

    if (auto ec = transition(job, TransferStatus::in_progress)) {
        return ec;
    }

    disk::FileWriter writer;
    if (auto ec = writer.open(job.part, offset)) {
        return ec;
    }

    // A complete part file from an interrupted verify goes straight to verifying
    if (!(size > 0 && offset == size)) {
        if (auto ec = stream(job, writer)) {
            return ec;
        }
    }
    writer.close();

    if (job.stop.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }
    if (job.state.bytes_downloaded != size) {
        spdlog::warn("{}: received {} bytes, expected {}", job.object.key,
                     job.state.bytes_downloaded, size);
        return make_error_code(DownloadErrc::size_mismatch);
    }

    if (auto ec = transition(job, TransferStatus::verifying)) {
        return ec;
    }
    if (auto ec = verify_part(job)) {
        return ec;
    }

    std::error_code ec;
    fs::rename(job.part, job.target, ec);
    if (ec) {
        spdlog::error("{}: rename to {} failed: {}", job.object.key, job.target.string(), ec.message());
        return make_error_code(disk::DiskErrc::rename_failed);
    }

    job.state.last_error.reset();
    return transition(job, TransferStatus::completed);
}

std::error_code TransferWorker::stream(Job& job, disk::FileWriter& writer) noexcept {
    const auto& key = job.object.key;
    const auto requested = writer.offset();

    std::uint64_t unsynced = 0;
    std::uint64_t delta = 0;
    auto last_report = std::chrono::steady_clock::now();

    // fdatasync the part file, persist the offset and report progress
    auto checkpoint = [&]() -> std::error_code {
        if (auto ec = writer.sync()) {
            return ec;
        }
        if (auto ec = store_.record(job.state)) {
            return ec;
        }
        if (delta > 0) {
            TransferEvent event;
            event.kind = EventKind::bytes_progressed;
            event.key = key;
            event.status = job.state.status;
            event.bytes_downloaded = job.state.bytes_downloaded;
            event.expected_size = job.object.size;
            event.delta = delta;
            event.attempt = job.state.attempt;
            emit(event);
        }
        unsynced = 0;
        delta = 0;
        last_report = std::chrono::steady_clock::now();
        return {};
    };

    RangeSink sink;
    sink.begin = [&](std::uint64_t start_offset) -> std::error_code {
        if (start_offset == writer.offset()) {
            return {};
        }
        // Server ignored the range: take the whole body from byte 0
        spdlog::warn("{}: server ignored range request from byte {}, restarting from 0", key, requested);
        if (auto ec = writer.truncate(start_offset)) {
            return ec;
        }
        job.state.bytes_downloaded = start_offset;
        return {};
    };
    sink.write = [&](const char* data, std::size_t size) -> std::error_code {
        if (job.state.bytes_downloaded + size > job.object.size) {
            return make_error_code(DownloadErrc::size_mismatch);
        }
        if (auto ec = writer.write(data, size)) {
            return ec;
        }
        job.state.bytes_downloaded += size;
        job.bytes_transferred += size;
        unsynced += size;
        delta += size;

        if (unsynced >= PROGRESS_REPORT_BYTES
            || std::chrono::steady_clock::now() - last_report >= PROGRESS_REPORT_INTERVAL) {
            return checkpoint();
        }
        return {};
    };

    auto result = transport_.get_object_range(key, requested, sink, job.stop);

    // Persist whatever reached the disk, also when the transfer broke off
    auto flushed = checkpoint();
    if (!result) {
        return result.error();
    }
    return flushed;
}

std::error_code TransferWorker::verify_part(Job& job) noexcept {
    TransferEvent event;
    event.kind = EventKind::verification_result;
    event.key = job.object.key;
    event.status = TransferStatus::verifying;
    event.bytes_downloaded = job.state.bytes_downloaded;
    event.expected_size = job.object.size;
    event.attempt = job.state.attempt;

    if (job.algorithm == ChecksumAlgorithm::none) {
        spdlog::debug("{}: no verifiable checksum, trusting byte count", job.object.key);
        event.verification = VerificationResult::skipped;
        emit(event);
        return {};
    }

    auto matched = verify(job.part, job.state.checksum, job.algorithm);
    if (!matched) {
        return matched.error();
    }
    if (!*matched) {
        spdlog::warn("{}: {} checksum mismatch", job.object.key, to_string(job.algorithm));
        event.verification = VerificationResult::failed;
        event.error = make_error_code(DownloadErrc::checksum_mismatch);
        emit(event);
        return event.error;
    }

    event.verification = VerificationResult::passed;
    emit(event);
    return {};
}

std::error_code TransferWorker::transition(Job& job, TransferStatus status) noexcept {
    job.state.status = status;
    if (auto ec = store_.record(job.state)) {
        return ec;
    }
    spdlog::debug("{}: {} ({}/{} bytes)", job.object.key, to_string(status),
                  job.state.bytes_downloaded, job.object.size);

    TransferEvent event;
    event.kind = EventKind::status_changed;
    event.key = job.object.key;
    event.status = status;
    event.bytes_downloaded = job.state.bytes_downloaded;
    event.expected_size = job.object.size;
    event.attempt = job.state.attempt;
    emit(event);
    return {};
}

void TransferWorker::interrupt(Job& job) noexcept {
    spdlog::debug("{}: interrupted at byte {}", job.object.key, job.state.bytes_downloaded);
    if (auto ec = transition(job, TransferStatus::pending)) {
        spdlog::error("{}: could not record interrupted state: {}", job.object.key, ec.message());
    }
}

void TransferWorker::emit(const TransferEvent& event) noexcept {
    if (!sink_) {
        return;
    }
    try {
        sink_(event);
    } catch (const std::exception& e) {
        spdlog::error("event handler failed: {}", e.what());
    }
}

} // namespace bucketdl::core
