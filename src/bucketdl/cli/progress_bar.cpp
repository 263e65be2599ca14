// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/cli/progress_bar.hpp>
#include <bucketdl/cli/output.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace bucketdl::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total_bytes, std::uint64_t total_files)
    : total_(total_bytes)
    , total_files_(total_files) {}

std::string ProgressBar::render(std::uint64_t current_bytes, std::uint64_t files_done,
                                std::uint64_t speed_bps) const {
    double percent = total_ == 0
        ? 100.0
        : static_cast<double>(current_bytes) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line = "Files ";
    line += std::to_string(files_done);
    line += "/";
    line += std::to_string(total_files_);
    line += " ";
    line += render_bar(percent);

    // Format percentage with padding
    int pct_int = static_cast<int>(percent);
    line += " ";
    if (pct_int < 100) line += " ";
    if (pct_int < 10) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += format_size(static_cast<double>(current_bytes));
    line += "/";
    line += format_size(static_cast<double>(total_));
    line += ")";

    if (speed_bps > 0) {
        line += " @ ";
        line += format_size(static_cast<double>(speed_bps));
        line += "/s";

        // ETA
        if (current_bytes < total_) {
            auto eta = static_cast<double>(total_ - current_bytes) / static_cast<double>(speed_bps);
            line += " ETA: ";
            line += format_duration(eta);
        }
    }
    return line;
}

void ProgressBar::update(std::uint64_t current_bytes, std::uint64_t files_done, std::uint64_t speed_bps) noexcept {
    if (finished_) return;

    int percent = total_ == 0 ? 100 : static_cast<int>(std::min<std::uint64_t>(current_bytes * 100 / total_, 100));

    // Only redraw on a new percent or a finished file
    if (percent == last_percent_ && files_done == last_files_) return;

    last_percent_ = percent;
    last_current_ = current_bytes;
    last_files_ = files_done;

    try {
        // Clear rest of line
        std::cerr << '\r' << render(current_bytes, files_done, speed_bps) << std::string(10, ' ') << std::flush;
    } catch (const std::exception&) {
        finished_ = true;
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    last_percent_ = -1;
    update(std::max(last_current_, total_), last_files_, 0);
    finished_ = true;
    std::cerr << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cerr << '\r' << std::string(100, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (empty > 0) {
        bar += '>';
        bar.append(static_cast<std::size_t>(empty - 1), ' ');
    }
    bar += "]";
    return bar;
}

} // namespace bucketdl::cli
