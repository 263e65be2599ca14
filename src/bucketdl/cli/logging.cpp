// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/cli/logging.hpp>
#include <bucketdl/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace bucketdl::cli {

std::error_code setup_logging(bool verbose, bool quiet,
                              const std::optional<std::string>& log_file) noexcept {
    auto level = spdlog::level::info;
    if (quiet) {
        level = spdlog::level::warn;
    } else if (verbose) {
        level = spdlog::level::debug;
    }

    std::error_code result;
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(level);
        sinks.push_back(console);

        if (log_file) {
            try {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file);
                file->set_level(spdlog::level::debug);  // Always log everything to file
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex&) {
                result = make_error_code(disk::DiskErrc::access_denied);
            }
        }

        spdlog::drop(LOGGER_NAME);
        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_pattern(LOG_PATTERN);
        logger->set_level(log_file && !result ? spdlog::level::debug : level);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        return make_error_code(disk::DiskErrc::write_error);
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }

    if (result) {
        spdlog::warn("Cannot open log file {}", *log_file);
    }
    return result;
}

} // namespace bucketdl::cli
