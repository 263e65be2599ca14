// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace bucketdl::disk {

namespace fs = std::filesystem;

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case ESPIPE:        return make_error_code(DiskErrc::seek_error);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , offset_(std::exchange(other.offset_, 0))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        offset_ = std::exchange(other.offset_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(const fs::path& path, std::uint64_t resume_offset) noexcept {
    close();

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return errno_to_error_code(ec.value());
        }
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return errno_to_error_code(err, DiskErrc::read_error);
    }
    if (static_cast<std::uint64_t>(st.st_size) < resume_offset) {
        ::close(fd);
        return make_error_code(DiskErrc::seek_error);
    }

    fd_ = fd;
    path_ = path;
    return truncate(resume_offset);
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd_, p, size, static_cast<off_t>(offset_));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        p += n;
        size -= static_cast<std::size_t>(n);
        offset_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::truncate(std::uint64_t offset) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0) {
        return errno_to_error_code(errno);
    }
    offset_ = offset;
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Helpers
//=============================================================================

std::uint64_t file_size_or_zero(const fs::path& path) noexcept {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::error_code write_atomically(const fs::path& path, std::string_view data) noexcept {
    fs::path tmp = path;
    tmp += ".tmp";

    FileWriter writer;
    if (auto ec = writer.open(tmp, 0)) {
        return ec;
    }
    if (auto ec = writer.write(data.data(), data.size())) {
        writer.close();
        return ec;
    }
    if (auto ec = writer.sync()) {
        writer.close();
        return ec;
    }
    writer.close();

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        return errno_to_error_code(errno, DiskErrc::rename_failed);
    }
    return sync_directory(path.has_parent_path() ? path.parent_path() : fs::path("."));
}

std::error_code sync_directory(const fs::path& dir) noexcept {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::read_error);
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        return errno_to_error_code(err);
    }
    return {};
}

} // namespace bucketdl::disk
