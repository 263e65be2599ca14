// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/config.hpp>
#include <bucketdl/core/remote_object.hpp>
#include <bucketdl/disk/file_writer.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bucketdl::core {

// Durable per-object transfer records for resume across restarts.
//
// The store is a snapshot file plus an append-only journal beside it
// ("<path>.journal"). record() appends one JSON line to the journal and
// syncs it. The journal is folded into the snapshot (written to
// "<path>.tmp", synced, renamed over it) by compact() and whenever it
// outgrows the record count, so writes stay proportional to one record.
// A torn last journal line from a crash is ignored on load.
// Writers are serialized by one mutex.
class ProgressStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit ProgressStore(std::filesystem::path path, std::string source = {},
                           std::size_t compact_threshold = PROGRESS_COMPACT_THRESHOLD);

    // Non-copyable, non-movable (owns a mutex)
    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    // Store file for a run context: "<output_root>/.bucketdl-progress-<hash>.json"
    [[nodiscard]] static std::filesystem::path default_path(const std::filesystem::path& output_root,
                                                            std::string_view source);

    // Read the snapshot and replay the journal over it. Never writes.
    // Missing files yield an empty map; unparseable content yields
    // DownloadErrc::corrupt_state.
    [[nodiscard]] std::expected<StateMap, std::error_code> load() noexcept;

    // Upsert one record and persist before returning
    [[nodiscard]] std::error_code record(const TransferState& state) noexcept;

    // Rewrite the snapshot from memory and drop the journal
    [[nodiscard]] std::error_code compact() noexcept;

    // Discard all records and delete the store files
    [[nodiscard]] std::error_code reset() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path journal_path() const;

    // Copy of the in-memory records
    [[nodiscard]] StateMap snapshot() const;

private:
    [[nodiscard]] std::error_code append_locked(const TransferState& state) noexcept;
    [[nodiscard]] std::error_code compact_locked() noexcept;

    std::filesystem::path path_;
    std::string source_;
    std::size_t compact_threshold_;
    StateMap records_;
    disk::FileWriter journal_;
    std::optional<std::uint64_t> journal_end_;   // End of the last complete line, once known
    std::size_t journal_lines_{0};
    mutable std::mutex mutex_;
};

} // namespace bucketdl::core
