// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/cli/output.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bucketdl::cli {

using json = nlohmann::json;

std::string format_size(double bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    for (const char* unit : units) {
        if (std::fabs(bytes) < 1024.0) {
            ss << bytes << ' ' << unit;
            return ss.str();
        }
        bytes /= 1024.0;
    }
    ss << bytes << " PB";
    return ss.str();
}

std::string format_duration(double seconds) {
    if (seconds < 60.0) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << seconds << 's';
        return ss.str();
    }
    auto total = static_cast<std::uint64_t>(seconds);
    if (seconds < 3600.0) {
        return std::to_string(total / 60) + "m " + std::to_string(total % 60) + "s";
    }
    return std::to_string(total / 3600) + "h " + std::to_string((total % 3600) / 60) + "m";
}

std::string_view outcome_code(core::RunOutcome outcome) noexcept {
    switch (outcome) {
        case core::RunOutcome::success:         return "SUCCESS";
        case core::RunOutcome::auth_failure:    return "AUTH_FAILED";
        case core::RunOutcome::network_error:   return "NETWORK_ERROR";
        case core::RunOutcome::not_found:       return "NOT_FOUND";
        case core::RunOutcome::partial_failure: return "PARTIAL_FAILURE";
        case core::RunOutcome::user_cancelled:  return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string format_summary(const core::Summary& summary,
                           const std::vector<DownloadedFile>& files,
                           bool as_json) {
    const double elapsed = static_cast<double>(summary.duration.count()) / 1000.0;
    const auto outcome = core::classify(summary);

    std::uint64_t total_bytes = 0;
    for (const auto& f : files) {
        total_bytes += f.size;
    }

    if (as_json) {
        json doc;
        doc["status"] = outcome == core::RunOutcome::success ? "success" : "error";
        doc["code"] = std::string(outcome_code(outcome));
        if (summary.dry_run) {
            doc["dry_run"] = true;
            doc["planned"] = summary.planned;
        } else {
            json list = json::array();
            for (const auto& f : files) {
                list.push_back({{"path", f.path}, {"size", f.size}, {"checksum", f.checksum}});
            }
            doc["files"] = std::move(list);
        }
        doc["total_bytes"] = total_bytes;
        doc["bytes_transferred"] = summary.bytes_transferred;
        doc["elapsed_seconds"] = std::round(elapsed * 100.0) / 100.0;
        doc["summary"] = {
            {"total", summary.total_objects},
            {"downloaded", summary.completed},
            {"skipped", summary.skipped},
            {"failed", summary.failed},
            {"pending", summary.pending},
        };
        doc["cancelled"] = summary.cancelled;
        if (summary.abort_error) {
            doc["abort_reason"] = summary.abort_error.message();
        }
        json failures = json::array();
        for (const auto& f : summary.failures) {
            failures.push_back({{"path", f.key}, {"error", f.message}});
        }
        doc["failures"] = std::move(failures);
        return doc.dump(2);
    }

    std::ostringstream out;
    if (summary.dry_run) {
        out << "\nDry run, nothing downloaded:\n";
        for (const auto& key : summary.planned) {
            out << "  would download: " << key << '\n';
        }
        out << "  Files: " << summary.pending << " to download, " << summary.skipped
            << " already complete, " << summary.failed << " rejected";
        for (const auto& f : summary.failures) {
            out << "\n  rejected: " << f.key << " (" << f.message << ')';
        }
        return out.str();
    }

    if (summary.cancelled) {
        out << "\nDownload cancelled:\n";
    } else if (summary.abort_error) {
        out << "\nDownload aborted: " << summary.abort_error.message() << '\n';
    } else {
        out << "\nDownload complete:\n";
    }
    out << "  Files: " << summary.completed << " downloaded, " << summary.skipped << " skipped, "
        << summary.failed << " failed";
    if (summary.pending > 0) {
        out << ", " << summary.pending << " pending";
    }
    out << "\n  Size:  " << format_size(static_cast<double>(total_bytes));
    out << "\n  Time:  " << format_duration(elapsed);
    for (const auto& f : summary.failures) {
        out << "\n  failed: " << f.key << " (" << f.message << ')';
    }
    return out.str();
}

std::string format_error(std::string_view code, std::string_view message, bool as_json) {
    if (as_json) {
        json doc = {
            {"status", "error"},
            {"code", std::string(code)},
            {"message", std::string(message)},
        };
        return doc.dump(2);
    }
    return "Error: " + std::string(message);
}

std::string format_list(const core::DirectoryContents& contents,
                        const std::vector<std::uint64_t>& file_sizes,
                        std::string_view prefix,
                        bool as_json) {
    if (as_json) {
        json files = json::array();
        for (std::size_t i = 0; i < contents.files.size(); ++i) {
            files.push_back({{"name", contents.files[i]},
                             {"size", i < file_sizes.size() ? file_sizes[i] : std::uint64_t{0}}});
        }
        json doc = {
            {"prefix", std::string(prefix)},
            {"folders", contents.folders},
            {"files", std::move(files)},
        };
        return doc.dump(2);
    }

    std::ostringstream out;
    if (!contents.folders.empty()) {
        out << "Folders:\n";
        for (const auto& folder : contents.folders) {
            out << "  " << folder << "/\n";
        }
    }
    if (!contents.files.empty()) {
        out << "Files:\n";
        for (std::size_t i = 0; i < contents.files.size(); ++i) {
            auto size = i < file_sizes.size() ? file_sizes[i] : std::uint64_t{0};
            out << "  " << std::left << std::setw(40) << contents.files[i]
                << ' ' << std::right << std::setw(10) << format_size(static_cast<double>(size)) << '\n';
        }
    }
    if (contents.folders.empty() && contents.files.empty()) {
        out << "(empty)\n";
    }

    auto text = out.str();
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

} // namespace bucketdl::cli
