// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/download_engine.hpp>
#include <bucketdl/core/object_listing.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bucketdl::cli {

// A file fetched in this run, for the report
struct DownloadedFile {
    std::string path;       // Object key
    std::uint64_t size{0};
    std::string checksum;   // Normalized etag
};

// "1.5 MB": one decimal, base 1024
[[nodiscard]] std::string format_size(double bytes);

// "42.0s", "3m 7s", "2h 5m"
[[nodiscard]] std::string format_duration(double seconds);

// Stable identifier for a run outcome ("AUTH_FAILED", "PARTIAL_FAILURE", ...)
[[nodiscard]] std::string_view outcome_code(core::RunOutcome outcome) noexcept;

// Final report for a download or dry run
[[nodiscard]] std::string format_summary(const core::Summary& summary,
                                         const std::vector<DownloadedFile>& files,
                                         bool json);

[[nodiscard]] std::string format_error(std::string_view code, std::string_view message, bool json);

// One level of a listing, with sizes for the files
[[nodiscard]] std::string format_list(const core::DirectoryContents& contents,
                                      const std::vector<std::uint64_t>& file_sizes,
                                      std::string_view prefix,
                                      bool json);

} // namespace bucketdl::cli
