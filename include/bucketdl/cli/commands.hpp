// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bucketdl::cli {

// Command line arguments, unresolved
struct CliArgs {
    std::optional<std::string> endpoint;
    std::optional<std::string> token;
    std::optional<std::string> listing;
    std::optional<std::string> output_dir;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    std::optional<std::string> since;
    std::optional<std::string> until;
    std::optional<std::string> max_size;
    std::optional<std::uint32_t> retries;
    std::optional<std::uint32_t> workers;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::string path;
    bool download_all{false};
    bool list_only{false};
    bool dry_run{false};
    bool fresh{false};
    bool skip_verify{false};
    bool json{false};
    bool quiet{false};
    bool verbose{false};
    bool yes{false};
    bool version{false};
    bool help{false};
    std::string error;    // First parse error, empty if none
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Resolve settings and run the requested command; returns the process exit code
[[nodiscard]] int run(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace bucketdl::cli
