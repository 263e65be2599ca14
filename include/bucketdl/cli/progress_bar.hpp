// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bucketdl::cli {

// Aggregate progress line for a multi-file run, drawn on stderr
class ProgressBar {
public:
    ProgressBar(std::uint64_t total_bytes, std::uint64_t total_files);

    // Update progress
    void update(std::uint64_t current_bytes, std::uint64_t files_done, std::uint64_t speed_bps = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }

    // Render without drawing
    [[nodiscard]] std::string render(std::uint64_t current_bytes, std::uint64_t files_done,
                                     std::uint64_t speed_bps) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::uint64_t total_{0};
    std::uint64_t total_files_{0};
    std::uint64_t last_current_{0};
    std::uint64_t last_files_{0};
    int last_percent_{-1};
    bool finished_{false};
};

} // namespace bucketdl::cli
