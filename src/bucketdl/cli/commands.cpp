// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/cli/commands.hpp>
#include <bucketdl/cli/logging.hpp>
#include <bucketdl/cli/output.hpp>
#include <bucketdl/cli/progress_bar.hpp>
#include <bucketdl/cli/settings.hpp>
#include <bucketdl/core/download_engine.hpp>
#include <bucketdl/core/error.hpp>
#include <bucketdl/core/http_session.hpp>
#include <bucketdl/core/integrity.hpp>
#include <bucketdl/core/object_filter.hpp>
#include <bucketdl/core/object_listing.hpp>
#include <bucketdl/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <pthread.h>
#include <thread>
#include <unistd.h>

using namespace bucketdl::core;

namespace chrono = std::chrono;

namespace bucketdl::cli {

namespace {

constexpr int EXIT_USAGE = 2;

// RAII libcurl global state
struct CurlGlobal {
    CurlGlobal() { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }
};

// Blocks SIGINT/SIGTERM for the process and turns them into a stop request.
// Must be created before any worker thread so they inherit the mask.
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source source) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, &previous_);

        thread_ = std::jthread([this, source](std::stop_token stop) mutable {
            const timespec timeout{0, 200'000'000};
            while (!stop.stop_requested()) {
                int sig = sigtimedwait(&signals_, nullptr, &timeout);
                if (sig != SIGINT && sig != SIGTERM) {
                    continue;
                }
                if (source.stop_requested()) {
                    // Second signal: give up on a clean shutdown
                    std::_Exit(exit_code(RunOutcome::user_cancelled));
                }
                spdlog::warn("Interrupted, saving progress (press Ctrl-C again to quit now)");
                source.request_stop();
            }
        });
    }

    ~SignalWatcher() {
        thread_.request_stop();
        if (thread_.joinable()) {
            thread_.join();
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t signals_{};
    sigset_t previous_{};
    std::jthread thread_;
};

// Aggregates engine events for the progress line and the final report
class RunTracker {
public:
    RunTracker(const std::map<std::string, const RemoteObject*>& objects, bool show_progress)
        : objects_(objects)
        , start_(chrono::steady_clock::now()) {
        std::uint64_t total = 0;
        for (const auto& [key, obj] : objects_) {
            total += obj->size;
        }
        if (show_progress) {
            bar_ = std::make_unique<ProgressBar>(total, objects_.size());
        }
    }

    void on_event(const TransferEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (event.kind) {
            case EventKind::bytes_progressed:
                transferred_ += event.delta;
                set_bytes(event.key, event.bytes_downloaded);
                break;
            case EventKind::status_changed:
                on_status(event);
                break;
            case EventKind::retry_scheduled:
                set_bytes(event.key, event.bytes_downloaded);
                break;
            case EventKind::verification_result:
                spdlog::debug("{}: verification {}", event.key, to_string(event.verification));
                break;
        }

        if (bar_) {
            auto elapsed = chrono::duration<double>(chrono::steady_clock::now() - start_).count();
            auto speed = elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(transferred_) / elapsed) : 0;
            bar_->update(current_, files_done_, speed);
        }
    }

    void finish(bool complete) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!bar_) return;
        if (complete) {
            bar_->finish();
        } else {
            bar_->clear();
        }
    }

    [[nodiscard]] std::vector<DownloadedFile> downloaded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return downloaded_;
    }

private:
    void on_status(const TransferEvent& event) {
        auto it = objects_.find(event.key);
        switch (event.status) {
            case TransferStatus::completed:
                ++files_done_;
                if (it != objects_.end()) {
                    set_bytes(event.key, it->second->size);
                    downloaded_.push_back({event.key, it->second->size, normalize_checksum(it->second->etag)});
                }
                spdlog::info("Downloaded {}", event.key);
                break;
            case TransferStatus::skipped:
                ++files_done_;
                if (it != objects_.end()) {
                    set_bytes(event.key, it->second->size);
                }
                spdlog::debug("Skipping completed file: {}", event.key);
                break;
            case TransferStatus::failed:
                ++files_done_;
                break;
            default:
                set_bytes(event.key, event.bytes_downloaded);
                break;
        }
    }

    void set_bytes(const std::string& key, std::uint64_t bytes) {
        auto& slot = bytes_[key];
        current_ = current_ - slot + bytes;
        slot = bytes;
    }

    const std::map<std::string, const RemoteObject*>& objects_;
    chrono::steady_clock::time_point start_;
    std::unique_ptr<ProgressBar> bar_;
    std::map<std::string, std::uint64_t> bytes_;
    std::vector<DownloadedFile> downloaded_;
    std::uint64_t current_{0};
    std::uint64_t transferred_{0};
    std::uint64_t files_done_{0};
    mutable std::mutex mutex_;
};

void print_error(bool json, std::string_view code, std::string_view message) {
    if (json) {
        std::cout << format_error(code, message, true) << std::endl;
    } else {
        std::cerr << format_error(code, message, false) << std::endl;
    }
}

std::string_view error_name(const std::error_code& ec) noexcept {
    if (ec == DownloadErrc::authentication_failed) return "AUTH_FAILED";
    if (ec == DownloadErrc::not_found) return "NOT_FOUND";
    if (ec == DownloadErrc::invalid_listing) return "INVALID_LISTING";
    return "NETWORK_ERROR";
}

int error_exit(const std::error_code& ec) noexcept {
    if (ec == DownloadErrc::authentication_failed) return exit_code(RunOutcome::auth_failure);
    if (ec == DownloadErrc::not_found) return exit_code(RunOutcome::not_found);
    return exit_code(RunOutcome::network_error);
}

bool confirm(std::uint64_t files, std::uint64_t bytes) {
    std::cerr << "Download " << files << " files (" << format_size(static_cast<double>(bytes))
              << ")? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

std::optional<std::uint32_t> parse_count(const char* text) noexcept {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > 1'000'000) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

int list_mode(const Settings& s, const std::vector<RemoteObject>& objects) {
    auto contents = list_contents(objects, s.prefix);

    std::map<std::string_view, std::uint64_t> sizes;
    for (const auto& obj : objects) {
        sizes.emplace(obj.key, obj.size);
    }
    std::vector<std::uint64_t> file_sizes;
    file_sizes.reserve(contents.files.size());
    for (const auto& name : contents.files) {
        auto it = sizes.find(s.prefix + name);
        file_sizes.push_back(it != sizes.end() ? it->second : 0);
    }

    std::cout << format_list(contents, file_sizes, s.prefix, s.json) << std::endl;
    return exit_code(RunOutcome::success);
}

int download_mode(const Settings& s, Transport& transport, const std::vector<RemoteObject>& listing) {
    auto under = under_prefix(listing, s.prefix);
    if (under.empty()) {
        auto msg = "No files found under '" + s.prefix + "'";
        if (s.json) {
            print_error(true, "NOT_FOUND", msg);
        } else {
            spdlog::warn("{}", msg);
        }
        return exit_code(RunOutcome::not_found);
    }

    auto selected = bucketdl::core::apply(s.filter, under);
    if (selected.size() < under.size()) {
        spdlog::info("{} file(s) excluded by filters", under.size() - selected.size());
    }

    EngineConfig config;
    config.concurrency = s.workers;
    config.retry_limit = s.retries;
    config.verify = s.verify;
    config.resume = s.resume;
    config.output_root = s.output_dir;
    config.source_prefix = s.prefix;
    config.source = s.endpoint + "/" + s.prefix;

    // Plan first: dry runs end here, real runs use it for the size prompt
    EngineConfig plan_config = config;
    plan_config.dry_run = true;
    DownloadEngine planner(transport, plan_config);
    auto plan = planner.run(selected);
    if (!plan) {
        print_error(s.json, "NETWORK_ERROR", "Cannot plan download: " + plan.error().message());
        return exit_code(RunOutcome::network_error);
    }

    if (s.dry_run) {
        std::cout << format_summary(*plan, {}, s.json) << std::endl;
        return exit_code(classify(*plan));
    }

    std::map<std::string, const RemoteObject*> by_key;
    for (const auto& obj : selected) {
        by_key.emplace(obj.key, &obj);
    }

    std::uint64_t planned_bytes = 0;
    for (const auto& key : plan->planned) {
        planned_bytes += by_key.at(key)->size;
    }
    if (plan->planned.empty()) {
        spdlog::info("All files already downloaded or filtered out.");
    } else {
        spdlog::info("Found {} files to download ({})", plan->planned.size(),
                     format_size(static_cast<double>(planned_bytes)));
    }

    if (planned_bytes > LARGE_DOWNLOAD_THRESHOLD && !s.yes && !s.quiet && !s.json
        && ::isatty(STDIN_FILENO)) {
        if (!confirm(plan->planned.size(), planned_bytes)) {
            std::cerr << "Cancelled." << std::endl;
            return exit_code(RunOutcome::user_cancelled);
        }
    }

    std::stop_source stop;
    SignalWatcher watcher(stop);

    RunTracker tracker(by_key, !s.quiet && !s.json);
    DownloadEngine engine(transport, config);
    engine.callback([&tracker](const TransferEvent& event) { tracker.on_event(event); });

    auto summary = engine.run(selected, stop.get_token());
    tracker.finish(summary && !summary->cancelled && !summary->abort_error);

    if (!summary) {
        print_error(s.json, "NETWORK_ERROR", "Cannot start download: " + summary.error().message());
        return exit_code(RunOutcome::network_error);
    }

    if (summary->cancelled) {
        spdlog::info("Cancelled by user. Run again to resume.");
    }
    std::cout << format_summary(*summary, tracker.downloaded(), s.json) << std::endl;
    return exit_code(classify(*summary));
}

int run_command(const CliArgs& args) {
    if (auto ec = setup_logging(args.verbose, args.quiet, args.log_file)) {
        // Console logging still works; keep going
        spdlog::debug("log setup: {}", ec.message());
    }

    auto env = process_environment();
    auto file_config = load_config_file(args.config_file, env);
    if (!file_config) {
        print_error(args.json, "INVALID_ARGUMENT", file_config.error());
        return EXIT_USAGE;
    }

    auto settings = resolve_settings(args, env, *file_config);
    if (!settings) {
        print_error(args.json, "INVALID_ARGUMENT", settings.error());
        return EXIT_USAGE;
    }
    const auto& s = *settings;

    if (s.token_from_file) {
        spdlog::warn("Token loaded from config file. Storing secrets in plaintext files is insecure; "
                     "consider the {} environment variable instead.", ENV_TOKEN);
    }
    if (s.endpoint.empty() && s.listing.empty()) {
        print_error(s.json, "INVALID_ARGUMENT",
                    "Endpoint required. Use -e, BUCKETDL_ENDPOINT or a config file.");
        return EXIT_USAGE;
    }
    if (!s.list_only && s.prefix.empty() && !s.download_all) {
        print_error(s.json, "INVALID_ARGUMENT", "Specify --path PREFIX or --all");
        return EXIT_USAGE;
    }

    CurlGlobal curl;
    HttpSession session(s.endpoint, s.token);

    spdlog::info("Reading listing {}", s.listing);
    auto listing = load_listing(s.listing, session);
    if (!listing) {
        print_error(s.json, error_name(listing.error()), "Failed to list objects: " + listing.error().message());
        return error_exit(listing.error());
    }

    if (s.list_only) {
        return list_mode(s, *listing);
    }
    if (s.download_all) {
        spdlog::info("Downloading entire bucket: {}/", s.endpoint);
    } else {
        spdlog::info("Downloading: {}/{}", s.endpoint, s.prefix);
    }
    return download_mode(s, session, *listing);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // Option value, or record a parse error
            auto value = [&]() -> std::optional<std::string> {
                if (i + 1 < argc) {
                    return std::string(argv[++i]);
                }
                if (args.error.empty()) {
                    args.error = "Missing value for " + arg;
                }
                return std::nullopt;
            };
            auto count = [&]() -> std::optional<std::uint32_t> {
                auto v = value();
                if (!v) return std::nullopt;
                auto n = parse_count(v->c_str());
                if (!n && args.error.empty()) {
                    args.error = "Invalid number for " + arg + ": " + *v;
                }
                return n;
            };

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }

            if (arg == "-e" || arg == "--endpoint")       args.endpoint = value();
            else if (arg == "-l" || arg == "--listing")   args.listing = value();
            else if (arg == "-t" || arg == "--token")     args.token = value();
            else if (arg == "-o" || arg == "--output")    args.output_dir = value();
            else if (arg == "--config")                   args.config_file = value();
            else if (arg == "--log-file")                 args.log_file = value();
            else if (arg == "--since")                    args.since = value();
            else if (arg == "--until")                    args.until = value();
            else if (arg == "--max-size")                 args.max_size = value();
            else if (arg == "--path")                     args.path = value().value_or("");
            else if (arg == "--include") {
                if (auto v = value()) args.include.push_back(*v);
            }
            else if (arg == "--exclude") {
                if (auto v = value()) args.exclude.push_back(*v);
            }
            else if (arg == "--retries")                  args.retries = count();
            else if (arg == "-w" || arg == "--workers")   args.workers = count();
            else if (arg == "-a" || arg == "--all")       args.download_all = true;
            else if (arg == "--list")                     args.list_only = true;
            else if (arg == "--dry-run")                  args.dry_run = true;
            else if (arg == "--resume")                   args.fresh = false;
            else if (arg == "--fresh")                    args.fresh = true;
            else if (arg == "--skip-verify")              args.skip_verify = true;
            else if (arg == "--json")                     args.json = true;
            else if (arg == "-q" || arg == "--quiet")     args.quiet = true;
            else if (arg == "-V" || arg == "--verbose")   args.verbose = true;
            else if (arg == "-y" || arg == "--yes")       args.yes = true;
            else if (args.error.empty()) {
                args.error = arg.starts_with("-") ? "Unknown option: " + arg : "Unexpected argument: " + arg;
            }
        }
    } catch (const std::bad_alloc&) {
        args.error = "out of memory";
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

int run(const CliArgs& args) noexcept {
    try {
        return run_command(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return exit_code(RunOutcome::network_error);
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "bucketdl - bulk downloader for HTTP object buckets\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "SOURCE:\n";
    std::cout << "  -e, --endpoint <URL>    Bucket base URL (env: BUCKETDL_ENDPOINT)\n";
    std::cout << "  -l, --listing <PATH>    Listing file or URL (env: BUCKETDL_LISTING,\n";
    std::cout << "                          default: <endpoint>/listing.json)\n";
    std::cout << "  -t, --token <TOKEN>     Bearer token (env: BUCKETDL_TOKEN)\n";
    std::cout << "      --config <FILE>     Config file (default: ~/.bucketdl.json)\n";
    std::cout << "\n";
    std::cout << "SELECTION:\n";
    std::cout << "      --path <PREFIX>     Download objects under PREFIX\n";
    std::cout << "  -a, --all               Download the entire bucket\n";
    std::cout << "      --list              List folders and files under --path\n";
    std::cout << "      --include <GLOB>    Only file names matching GLOB (repeatable)\n";
    std::cout << "      --exclude <GLOB>    Skip file names matching GLOB (repeatable)\n";
    std::cout << "      --since <YYYY-MM>   Only objects modified in or after this month\n";
    std::cout << "      --until <YYYY-MM>   Only objects modified in or before this month\n";
    std::cout << "      --max-size <SIZE>   Skip objects larger than SIZE (e.g. 10MB, 1.5GB)\n";
    std::cout << "\n";
    std::cout << "DOWNLOAD:\n";
    std::cout << "  -o, --output <DIR>      Output directory (default: current directory)\n";
    std::cout << "  -w, --workers <N>       Parallel downloads (default: 4, max: 32)\n";
    std::cout << "      --retries <N>       Retries per file (default: 3)\n";
    std::cout << "      --resume            Resume interrupted downloads (default)\n";
    std::cout << "      --fresh             Discard saved progress and start over\n";
    std::cout << "      --skip-verify       Do not verify checksums\n";
    std::cout << "      --dry-run           Show what would be downloaded\n";
    std::cout << "  -y, --yes               Do not ask before large downloads\n";
    std::cout << "\n";
    std::cout << "OUTPUT:\n";
    std::cout << "      --json              Machine-readable output\n";
    std::cout << "  -q, --quiet             Warnings and errors only, no progress bar\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "      --log-file <FILE>   Also write a debug log to FILE\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "\n";
    std::cout << "EXIT CODES:\n";
    std::cout << "  0 success, 1 authentication failure, 2 network error, 3 not found,\n";
    std::cout << "  4 partial failure, 5 cancelled\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -e https://data.example.org --path 2024/06 -o ./data\n";
    std::cout << "  " << program_name << " -e https://data.example.org --all --include '*.json.gz' -w 8\n";
    std::cout << "  " << program_name << " -e https://data.example.org --list --path 2024\n";
}

void print_version() noexcept {
    std::cout << "bucketdl " << bucketdl::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog, nlohmann/json\n";
}

} // namespace bucketdl::cli
