// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/cli/commands.hpp>
#include <bucketdl/core/config.hpp>
#include <bucketdl/core/object_filter.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace bucketdl::cli {

constexpr const char* ENV_ENDPOINT = "BUCKETDL_ENDPOINT";
constexpr const char* ENV_TOKEN = "BUCKETDL_TOKEN";
constexpr const char* ENV_LISTING = "BUCKETDL_LISTING";

// Environment lookup, injectable for tests
using Environment = std::function<std::optional<std::string>(const char* name)>;

[[nodiscard]] Environment process_environment();

// Fully resolved run settings
struct Settings {
    std::string endpoint;
    std::string token;
    std::string listing;                    // File path or http(s) URL
    std::filesystem::path output_dir;       // Absolute
    std::string prefix;                     // Normalized, "" for the whole bucket
    bool download_all{false};
    bool list_only{false};
    bool dry_run{false};
    bool json{false};
    bool quiet{false};
    bool verbose{false};
    bool yes{false};
    bool resume{true};
    bool verify{true};
    bool token_from_file{false};
    std::optional<std::string> log_file;
    std::uint32_t retries{core::RETRY_COUNT};
    std::uint32_t workers{core::DEFAULT_CONCURRENCY};
    core::ObjectFilter filter;
};

// Config file candidates, in lookup order, when --config is not given
[[nodiscard]] std::vector<std::filesystem::path> default_config_paths(const Environment& env);

// Load the first existing config file. An explicit path must exist.
// No file at all yields an empty object.
[[nodiscard]] std::expected<nlohmann::json, std::string>
load_config_file(const std::optional<std::string>& explicit_path, const Environment& env);

// Merge sources: command line > environment > config file > defaults
[[nodiscard]] std::expected<Settings, std::string>
resolve_settings(const CliArgs& args, const Environment& env, const nlohmann::json& file_config);

} // namespace bucketdl::cli
