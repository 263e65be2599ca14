// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <bucketdl/core/error.hpp>
#include <bucketdl/core/remote_object.hpp>
#include <chrono>
#include <compare>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bucketdl::core {

struct YearMonth {
    int year{0};
    unsigned month{0};   // 1..12

    auto operator<=>(const YearMonth&) const = default;
};

// "YYYY-MM"
[[nodiscard]] std::expected<YearMonth, std::error_code> parse_year_month(std::string_view text) noexcept;

// UTC month of a time point
[[nodiscard]] YearMonth year_month_of(std::chrono::system_clock::time_point tp) noexcept;

// "10MB", "1.5 GB", "512": units B/KB/MB/GB/TB, base 1024, case-insensitive
[[nodiscard]] std::expected<std::uint64_t, std::error_code> parse_size(std::string_view text) noexcept;

// Selection criteria applied to a listing before download
struct ObjectFilter {
    std::vector<std::string> include;      // Glob on the file name; any must match
    std::vector<std::string> exclude;      // Glob on the file name; none may match
    std::optional<std::uint64_t> max_size;
    std::optional<YearMonth> since;        // Inclusive
    std::optional<YearMonth> until;        // Inclusive

    [[nodiscard]] bool accepts(const RemoteObject& object) const noexcept;
    [[nodiscard]] bool empty() const noexcept;
};

[[nodiscard]] std::vector<RemoteObject> apply(const ObjectFilter& filter,
                                              std::span<const RemoteObject> objects);

} // namespace bucketdl::core
