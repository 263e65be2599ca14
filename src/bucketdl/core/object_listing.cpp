// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/object_listing.hpp>
#include <bucketdl/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <set>

namespace bucketdl::core {

using json = nlohmann::json;

namespace {

bool read_int(std::string_view text, std::size_t pos, std::size_t len, int& out) noexcept {
    if (pos + len > text.size()) return false;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
    return ec == std::errc{} && ptr == text.data() + pos + len;
}

bool is_http_url(std::string_view location) noexcept {
    return location.starts_with("http://") || location.starts_with("https://");
}

std::expected<std::string, std::error_code> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }
    std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return text;
}

} // namespace

std::expected<std::chrono::system_clock::time_point, std::error_code>
parse_timestamp(std::string_view text) noexcept {
    using namespace std::chrono;
    const auto invalid = make_error_code(DownloadErrc::invalid_listing);

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (text.size() < 19 || text[4] != '-' || text[7] != '-'
        || (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::unexpected(invalid);
    }
    if (!read_int(text, 0, 4, y) || !read_int(text, 5, 2, mo) || !read_int(text, 8, 2, d)
        || !read_int(text, 11, 2, h) || !read_int(text, 14, 2, mi) || !read_int(text, 17, 2, s)) {
        return std::unexpected(invalid);
    }

    auto rest = text.substr(19);
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9') {
            rest.remove_prefix(1);
        }
    }
    if (!(rest.empty() || rest == "Z" || rest == "+00:00")) {
        return std::unexpected(invalid);
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::unexpected(invalid);
    }
    return sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
}

std::expected<std::vector<RemoteObject>, std::error_code>
parse_listing(std::string_view text) noexcept {
    const auto invalid = make_error_code(DownloadErrc::invalid_listing);
    try {
        json doc = json::parse(text, nullptr, false);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("objects") || !doc["objects"].is_array()) {
            return std::unexpected(invalid);
        }

        std::vector<RemoteObject> objects;
        objects.reserve(doc["objects"].size());
        for (const auto& item : doc["objects"]) {
            RemoteObject obj;
            obj.key = item.at("key").get<std::string>();
            obj.size = item.at("size").get<std::uint64_t>();
            obj.etag = item.value("etag", std::string{});

            if (auto it = item.find("last_modified"); it != item.end() && !it->is_null()) {
                auto tp = parse_timestamp(it->get<std::string>());
                if (!tp) {
                    spdlog::warn("Listing entry {} has a bad timestamp", obj.key);
                    return std::unexpected(tp.error());
                }
                obj.last_modified = *tp;
            }
            objects.push_back(std::move(obj));
        }
        return objects;
    } catch (const json::exception& e) {
        spdlog::debug("listing: {}", e.what());
        return std::unexpected(invalid);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::vector<RemoteObject>, std::error_code>
load_listing(std::string_view location, HttpSession& session) noexcept {
    try {
        std::string where(location);
        auto text = is_http_url(location) ? session.fetch(where) : read_file(where);
        if (!text) {
            spdlog::error("Could not read listing {}: {}", where, text.error().message());
            return std::unexpected(text.error());
        }
        return parse_listing(*text);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string normalize_prefix(std::string_view path) {
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    if (path.empty()) {
        return {};
    }
    std::string prefix(path);
    prefix += '/';
    return prefix;
}

std::vector<RemoteObject> under_prefix(std::span<const RemoteObject> objects, std::string_view prefix) {
    std::vector<RemoteObject> result;
    std::copy_if(objects.begin(), objects.end(), std::back_inserter(result),
                 [&](const RemoteObject& obj) {
                     return obj.key.starts_with(prefix) && obj.key != prefix;
                 });
    return result;
}

DirectoryContents list_contents(std::span<const RemoteObject> objects, std::string_view prefix) {
    std::set<std::string> folders;
    std::set<std::string> files;

    for (const auto& obj : objects) {
        if (!obj.key.starts_with(prefix) || obj.key == prefix) {
            continue;
        }
        std::string_view rest = std::string_view(obj.key).substr(prefix.size());
        auto slash = rest.find('/');
        if (slash == std::string_view::npos) {
            files.emplace(rest);
        } else if (slash > 0) {
            folders.emplace(rest.substr(0, slash));
        }
    }

    return {{folders.begin(), folders.end()}, {files.begin(), files.end()}};
}

} // namespace bucketdl::core
