// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/disk/error.hpp>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string_view>

namespace bucketdl::disk {

// Sequential writer for one partial download file.
// Bytes are only ever appended at the current end, so a resumed file
// extends from the last confirmed offset.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open (creating parent directories) and truncate to resume_offset.
    // resume_offset must not exceed the current file size.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path,
                                       std::uint64_t resume_offset = 0) noexcept;

    // Append data at the current end
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Discard everything after offset and continue writing from there
    [[nodiscard]] std::error_code truncate(std::uint64_t offset) noexcept;

    // Force written bytes to stable storage
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t offset_{0};
    std::filesystem::path path_;
};

// Size of a regular file, or 0 if it does not exist
[[nodiscard]] std::uint64_t file_size_or_zero(const std::filesystem::path& path) noexcept;

// Replace path with data via "<path>.tmp" + fsync + rename, then sync the
// parent directory so the rename itself is durable
[[nodiscard]] std::error_code write_atomically(const std::filesystem::path& path,
                                               std::string_view data) noexcept;

// fsync a directory's entries
[[nodiscard]] std::error_code sync_directory(const std::filesystem::path& dir) noexcept;

} // namespace bucketdl::disk
