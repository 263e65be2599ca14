// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/disk/safe_path.hpp>
#include <algorithm>

namespace bucketdl::disk {

namespace fs = std::filesystem;

namespace {

fs::path resolve(const fs::path& p, std::error_code& ec) {
    auto absolute = fs::absolute(p, ec);
    if (ec) {
        return {};
    }
    auto resolved = fs::weakly_canonical(absolute, ec).lexically_normal();
    // "/root/out/" normalizes with a trailing empty element
    if (!resolved.has_filename() && resolved.has_parent_path() && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

bool is_within(const fs::path& base, const fs::path& candidate) {
    auto [base_it, cand_it] = std::mismatch(base.begin(), base.end(),
                                            candidate.begin(), candidate.end());
    return base_it == base.end() && cand_it != candidate.end();
}

} // namespace

std::expected<fs::path, std::error_code>
safe_join(const fs::path& base, std::string_view untrusted) noexcept {
    const auto traversal = make_error_code(DiskErrc::path_traversal);

    if (untrusted.empty() || std::all_of(untrusted.begin(), untrusted.end(),
                                         [](char c) { return c == ' ' || c == '\t'; })) {
        return std::unexpected(traversal);
    }
    if (untrusted.front() == '/' || untrusted.front() == '.') {
        return std::unexpected(traversal);
    }
    if (untrusted.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    try {
        std::error_code ec;
        fs::path root = resolve(base, ec);
        if (ec) {
            return std::unexpected(make_error_code(DiskErrc::invalid_path));
        }

        fs::path joined = resolve(root / fs::path(untrusted), ec);
        if (ec) {
            return std::unexpected(make_error_code(DiskErrc::invalid_path));
        }

        if (!is_within(root, joined)) {
            return std::unexpected(traversal);
        }
        return joined;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
}

std::string relative_key(std::string_view key, std::string_view prefix) {
    std::string_view rest = key;
    if (!prefix.empty() && key.starts_with(prefix)) {
        rest.remove_prefix(prefix.size());
    }
    while (!rest.empty() && rest.front() == '/') {
        rest.remove_prefix(1);
    }
    if (rest.empty()) {
        auto slash = key.rfind('/');
        rest = slash == std::string_view::npos ? key : key.substr(slash + 1);
    }
    return std::string(rest);
}

} // namespace bucketdl::disk
