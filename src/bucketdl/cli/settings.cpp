// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/cli/settings.hpp>
#include <bucketdl/core/object_listing.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace bucketdl::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// First non-empty of command line, environment, config file
std::optional<std::string> pick(const std::optional<std::string>& cli,
                                const Environment& env, const char* env_name,
                                const json& file, const char* file_key) {
    if (cli && !cli->empty()) {
        return cli;
    }
    if (env_name) {
        if (auto value = env(env_name); value && !value->empty()) {
            return value;
        }
    }
    if (auto it = file.find(file_key); it != file.end() && it->is_string()) {
        auto value = it->get<std::string>();
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::uint32_t> file_uint(const json& file, const char* key) {
    if (auto it = file.find(key); it != file.end() && it->is_number_unsigned()) {
        return it->get<std::uint32_t>();
    }
    return std::nullopt;
}

fs::path expand_home(const std::string& path, const Environment& env) {
    if (path == "~" || path.starts_with("~/")) {
        if (auto home = env("HOME")) {
            return fs::path(*home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

} // namespace

Environment process_environment() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::vector<fs::path> default_config_paths(const Environment& env) {
    auto home = env("HOME");
    if (!home || home->empty()) {
        return {};
    }
    fs::path base(*home);
    return {base / ".bucketdl.json", base / ".config" / "bucketdl" / "config.json"};
}

std::expected<json, std::string>
load_config_file(const std::optional<std::string>& explicit_path, const Environment& env) {
    std::vector<fs::path> candidates;
    if (explicit_path) {
        candidates.push_back(expand_home(*explicit_path, env));
    } else {
        candidates = default_config_paths(env);
    }

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            if (explicit_path) {
                return std::unexpected("Config file not found: " + path.string());
            }
            continue;
        }

        std::ifstream file(path);
        if (!file) {
            return std::unexpected("Cannot read config file: " + path.string());
        }
        json doc = json::parse(file, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return std::unexpected("Invalid config file: " + path.string());
        }
        spdlog::debug("Loaded config from {}", path.string());
        return doc;
    }
    return json::object();
}

std::expected<Settings, std::string>
resolve_settings(const CliArgs& args, const Environment& env, const json& file_config) {
    Settings s;

    try {
        s.endpoint = pick(args.endpoint, env, ENV_ENDPOINT, file_config, "endpoint").value_or("");
        while (!s.endpoint.empty() && s.endpoint.back() == '/') {
            s.endpoint.pop_back();
        }

        if (auto token = pick(args.token, env, ENV_TOKEN, json::object(), "token")) {
            s.token = *token;
        } else if (auto it = file_config.find("token"); it != file_config.end() && it->is_string()) {
            s.token = it->get<std::string>();
            s.token_from_file = !s.token.empty();
        }

        auto listing = pick(args.listing, env, ENV_LISTING, file_config, "listing");
        if (listing) {
            s.listing = *listing;
        } else if (!s.endpoint.empty()) {
            s.listing = s.endpoint + "/listing.json";
        }

        // Output directory: command line > config file > current directory
        auto output = pick(args.output_dir, env, nullptr, file_config, "output_dir");
        std::error_code ec;
        fs::path out = output ? expand_home(*output, env) : fs::current_path(ec);
        if (ec) {
            return std::unexpected("Cannot determine current directory: " + ec.message());
        }
        s.output_dir = fs::absolute(out, ec).lexically_normal();
        if (ec) {
            return std::unexpected("Invalid output directory: " + out.string());
        }

        s.prefix = core::normalize_prefix(args.path);
        s.download_all = args.download_all;
        s.list_only = args.list_only;
        s.dry_run = args.dry_run;
        s.json = args.json;
        s.quiet = args.quiet;
        s.verbose = args.verbose;
        s.yes = args.yes;
        s.resume = !args.fresh;
        s.verify = !args.skip_verify;
        s.log_file = args.log_file;

        if (args.retries) {
            s.retries = *args.retries;
        } else if (auto r = file_uint(file_config, "retries")) {
            s.retries = *r;
        }

        if (args.workers) {
            s.workers = *args.workers;
        } else if (auto w = file_uint(file_config, "workers")) {
            s.workers = *w;
        }
        if (s.workers == 0) {
            return std::unexpected(std::string("Workers must be at least 1"));
        }
        if (s.workers > core::MAX_CONCURRENCY) {
            spdlog::warn("Limiting workers to {}", core::MAX_CONCURRENCY);
            s.workers = core::MAX_CONCURRENCY;
        }

        s.filter.include = args.include;
        s.filter.exclude = args.exclude;
        if (args.max_size) {
            auto size = core::parse_size(*args.max_size);
            if (!size) {
                return std::unexpected("Invalid size format: " + *args.max_size);
            }
            s.filter.max_size = *size;
        }
        if (args.since) {
            auto ym = core::parse_year_month(*args.since);
            if (!ym) {
                return std::unexpected("Invalid --since value (expected YYYY-MM): " + *args.since);
            }
            s.filter.since = *ym;
        }
        if (args.until) {
            auto ym = core::parse_year_month(*args.until);
            if (!ym) {
                return std::unexpected("Invalid --until value (expected YYYY-MM): " + *args.until);
            }
            s.filter.until = *ym;
        }
        if (s.filter.since && s.filter.until && *s.filter.until < *s.filter.since) {
            return std::unexpected(std::string("--until is before --since"));
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid config value: ") + e.what());
    }

    return s;
}

} // namespace bucketdl::cli
