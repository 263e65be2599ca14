// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/object_filter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fnmatch.h>
#include <iterator>

namespace bucketdl::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) == std::toupper(static_cast<unsigned char>(y));
           });
}

std::string_view file_name(std::string_view key) noexcept {
    auto slash = key.rfind('/');
    return slash == std::string_view::npos ? key : key.substr(slash + 1);
}

bool glob_match(const std::string& pattern, const std::string& name) noexcept {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

} // namespace

std::expected<YearMonth, std::error_code> parse_year_month(std::string_view text) noexcept {
    const auto invalid = make_error_code(DownloadErrc::invalid_argument);
    text = trim(text);
    if (text.size() != 7 || text[4] != '-') {
        return std::unexpected(invalid);
    }

    YearMonth ym;
    auto [yp, yec] = std::from_chars(text.data(), text.data() + 4, ym.year);
    auto [mp, mec] = std::from_chars(text.data() + 5, text.data() + 7, ym.month);
    if (yec != std::errc{} || yp != text.data() + 4 || mec != std::errc{} || mp != text.data() + 7) {
        return std::unexpected(invalid);
    }
    if (ym.month < 1 || ym.month > 12) {
        return std::unexpected(invalid);
    }
    return ym;
}

YearMonth year_month_of(std::chrono::system_clock::time_point tp) noexcept {
    std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};
    return {static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month())};
}

std::expected<std::uint64_t, std::error_code> parse_size(std::string_view text) noexcept {
    const auto invalid = make_error_code(DownloadErrc::invalid_argument);
    text = trim(text);

    std::size_t n = 0;
    while (n < text.size() && (std::isdigit(static_cast<unsigned char>(text[n])) || text[n] == '.')) {
        ++n;
    }
    if (n == 0 || text.front() == '.') {
        return std::unexpected(invalid);
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + n, value);
    if (ec != std::errc{} || ptr != text.data() + n) {
        return std::unexpected(invalid);
    }

    auto unit = trim(text.substr(n));
    double multiplier = 0.0;
    if (unit.empty() || iequals(unit, "B"))  multiplier = 1.0;
    else if (iequals(unit, "KB"))            multiplier = 1024.0;
    else if (iequals(unit, "MB"))            multiplier = 1024.0 * 1024;
    else if (iequals(unit, "GB"))            multiplier = 1024.0 * 1024 * 1024;
    else if (iequals(unit, "TB"))            multiplier = 1024.0 * 1024 * 1024 * 1024;
    else return std::unexpected(invalid);

    double bytes = std::floor(value * multiplier);
    if (bytes >= 18446744073709551615.0) {
        return std::unexpected(invalid);
    }
    return static_cast<std::uint64_t>(bytes);
}

//=============================================================================
// ObjectFilter
//=============================================================================

bool ObjectFilter::accepts(const RemoteObject& object) const noexcept {
    try {
        std::string name(file_name(object.key));

        if (!include.empty()
            && std::none_of(include.begin(), include.end(),
                            [&](const std::string& p) { return glob_match(p, name); })) {
            spdlog::debug("Skipping {}: doesn't match include patterns", object.key);
            return false;
        }
        if (std::any_of(exclude.begin(), exclude.end(),
                        [&](const std::string& p) { return glob_match(p, name); })) {
            spdlog::debug("Skipping {}: matches exclude pattern", object.key);
            return false;
        }
    } catch (const std::bad_alloc&) {
        return false;
    }

    if (max_size && object.size > *max_size) {
        spdlog::debug("Skipping {}: size {} exceeds max {}", object.key, object.size, *max_size);
        return false;
    }

    if (since || until) {
        auto ym = year_month_of(object.last_modified);
        if ((since && ym < *since) || (until && ym > *until)) {
            spdlog::debug("Skipping {}: outside date range", object.key);
            return false;
        }
    }
    return true;
}

bool ObjectFilter::empty() const noexcept {
    return include.empty() && exclude.empty() && !max_size && !since && !until;
}

std::vector<RemoteObject> apply(const ObjectFilter& filter, std::span<const RemoteObject> objects) {
    std::vector<RemoteObject> selected;
    selected.reserve(objects.size());
    std::copy_if(objects.begin(), objects.end(), std::back_inserter(selected),
                 [&](const RemoteObject& obj) { return filter.accepts(obj); });
    return selected;
}

} // namespace bucketdl::core
