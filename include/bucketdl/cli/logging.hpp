// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <optional>
#include <string>
#include <system_error>

namespace bucketdl::cli {

constexpr const char* LOGGER_NAME = "bucketdl";
constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S %-5l %v";

// Install the "bucketdl" logger as spdlog's default: colored stderr at
// warn (quiet), debug (verbose) or info, plus a debug-level file sink when
// log_file is set. Returns an error if the log file cannot be opened.
[[nodiscard]] std::error_code setup_logging(bool verbose, bool quiet,
                                            const std::optional<std::string>& log_file) noexcept;

} // namespace bucketdl::cli
