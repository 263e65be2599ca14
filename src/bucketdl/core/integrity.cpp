// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/integrity.hpp>
#include <bucketdl/core/config.hpp>
#include <bucketdl/disk/error.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <unistd.h>
#include <vector>

namespace bucketdl::core {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

// RAII read-only descriptor
struct Fd {
    int fd{-1};
    explicit Fd(int f) : fd(f) {}
    ~Fd() { if (fd >= 0) ::close(fd); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
};

const EVP_MD* evp_for(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::md5:    return EVP_md5();
        case ChecksumAlgorithm::sha1:   return EVP_sha1();
        case ChecksumAlgorithm::sha256: return EVP_sha256();
        case ChecksumAlgorithm::none:   break;
    }
    return nullptr;
}

std::expected<EvpCtx, std::error_code> begin_digest(ChecksumAlgorithm algorithm) noexcept {
    const EVP_MD* md = evp_for(algorithm);
    if (!md) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }
    EvpCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_mismatch));
    }
    return ctx;
}

std::expected<std::string, std::error_code> finish_digest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_mismatch));
    }

    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += digits[hash[i] >> 4];
        hex += digits[hash[i] & 0x0F];
    }
    return hex;
}

bool is_hex(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

std::string_view to_string(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::none:   return "none";
        case ChecksumAlgorithm::md5:    return "md5";
        case ChecksumAlgorithm::sha1:   return "sha1";
        case ChecksumAlgorithm::sha256: return "sha256";
    }
    return "unknown";
}

std::string normalize_checksum(std::string_view etag) {
    while (!etag.empty() && (etag.front() == '"' || etag.front() == ' ')) etag.remove_prefix(1);
    while (!etag.empty() && (etag.back() == '"' || etag.back() == ' ')) etag.remove_suffix(1);
    // Weak validators ("W/\"...\"") carry the same opaque value
    if (etag.starts_with("W/")) {
        etag.remove_prefix(2);
        while (!etag.empty() && etag.front() == '"') etag.remove_prefix(1);
    }

    std::string out;
    out.reserve(etag.size());
    for (char c : etag) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

ChecksumAlgorithm detect_algorithm(std::string_view checksum) noexcept {
    if (!is_hex(checksum)) {
        return ChecksumAlgorithm::none;
    }
    switch (checksum.size()) {
        case 32: return ChecksumAlgorithm::md5;
        case 40: return ChecksumAlgorithm::sha1;
        case 64: return ChecksumAlgorithm::sha256;
        default: return ChecksumAlgorithm::none;
    }
}

std::expected<std::string, std::error_code>
digest(const std::filesystem::path& path, ChecksumAlgorithm algorithm) noexcept {
    auto ctx = begin_digest(algorithm);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    Fd file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.fd < 0) {
        return std::unexpected(disk::errno_to_error_code(errno, disk::DiskErrc::read_error));
    }

    try {
        std::vector<char> buffer(VERIFY_CHUNK_SIZE);
        while (true) {
            ssize_t n = ::read(file.fd, buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                return std::unexpected(disk::errno_to_error_code(errno, disk::DiskErrc::read_error));
            }
            if (n == 0) break;
            if (EVP_DigestUpdate(ctx->get(), buffer.data(), static_cast<std::size_t>(n)) != 1) {
                return std::unexpected(make_error_code(DownloadErrc::checksum_mismatch));
            }
        }
        return finish_digest(ctx->get());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::expected<std::string, std::error_code>
digest_bytes(std::string_view data, ChecksumAlgorithm algorithm) noexcept {
    auto ctx = begin_digest(algorithm);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    if (EVP_DigestUpdate(ctx->get(), data.data(), data.size()) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_mismatch));
    }
    try {
        return finish_digest(ctx->get());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_mismatch));
    }
}

std::expected<bool, std::error_code>
verify(const std::filesystem::path& path,
       std::string_view expected_checksum,
       ChecksumAlgorithm algorithm) noexcept {
    auto actual = digest(path, algorithm);
    if (!actual) {
        return std::unexpected(actual.error());
    }
    try {
        return *actual == normalize_checksum(expected_checksum);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace bucketdl::core
