// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/disk/error.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace bucketdl::disk {

// Join an untrusted relative path (an object key) onto base.
//
// Rejects with DiskErrc::path_traversal when the path is empty, absolute,
// starts with '.', or resolves (after "..", and symlinks that already exist)
// to a location outside base. The returned path is absolute.
[[nodiscard]] std::expected<std::filesystem::path, std::error_code>
safe_join(const std::filesystem::path& base, std::string_view untrusted) noexcept;

// Key relative to the listing prefix: prefix removed, leading '/' stripped,
// falling back to the last key segment when nothing remains
[[nodiscard]] std::string relative_key(std::string_view key, std::string_view prefix);

} // namespace bucketdl::disk
