// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/progress_store.hpp>
#include <bucketdl/core/error.hpp>
#include <bucketdl/disk/error.hpp>
#include <bucketdl/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <ios>
#include <iterator>
#include <stdexcept>

namespace bucketdl::core {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// 64-bit FNV-1a, stable across platforms and runs
std::uint64_t fnv1a(std::string_view data) noexcept {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::string to_hex(std::uint64_t value) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[value & 0xF];
        value >>= 4;
    }
    return out;
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

json to_json(const TransferState& s) {
    json j = {
        {"key", s.key},
        {"status", std::string(to_string(s.status))},
        {"bytes_downloaded", s.bytes_downloaded},
        {"expected_size", s.expected_size},
        {"attempt", s.attempt},
        {"checksum", s.checksum},
    };
    if (s.last_error) {
        j["last_error"] = *s.last_error;
    }
    return j;
}

// Throws nlohmann::json::exception on missing or mistyped fields,
// std::invalid_argument on an unknown status
TransferState from_json(const json& j) {
    TransferState s;
    s.key = j.at("key").get<std::string>();
    auto status = status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown transfer status");
    }
    s.status = *status;
    s.bytes_downloaded = j.at("bytes_downloaded").get<std::uint64_t>();
    s.expected_size = j.at("expected_size").get<std::uint64_t>();
    s.attempt = j.value("attempt", 0u);
    s.checksum = j.value("checksum", std::string{});
    if (j.contains("last_error") && j["last_error"].is_string()) {
        s.last_error = j["last_error"].get<std::string>();
    }

    // A crash mid-transfer leaves a resumable record
    if (s.status == TransferStatus::in_progress || s.status == TransferStatus::verifying) {
        s.status = TransferStatus::pending;
    }
    return s;
}

std::string read_whole(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::ios_base::failure("cannot open " + path.string());
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

} // namespace

ProgressStore::ProgressStore(fs::path path, std::string source, std::size_t compact_threshold)
    : path_(std::move(path))
    , source_(std::move(source))
    , compact_threshold_(std::max<std::size_t>(compact_threshold, 1)) {}

fs::path ProgressStore::default_path(const fs::path& output_root, std::string_view source) {
    return output_root / (".bucketdl-progress-" + to_hex(fnv1a(source)) + ".json");
}

fs::path ProgressStore::journal_path() const {
    fs::path p = path_;
    p += ".journal";
    return p;
}

std::expected<StateMap, std::error_code> ProgressStore::load() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    journal_.close();
    journal_end_.reset();
    journal_lines_ = 0;

    std::error_code ec;
    const bool has_snapshot = fs::exists(path_, ec);
    const auto journal = journal_path();
    const bool has_journal = fs::exists(journal, ec);

    try {
        StateMap loaded;

        if (has_snapshot) {
            json doc = json::parse(read_whole(path_), nullptr, false);
            if (doc.is_discarded() || !doc.is_object()) {
                return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
            }
            if (doc.value("version", 0) != FORMAT_VERSION) {
                return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
            }
            for (const auto& item : doc.at("records")) {
                auto state = from_json(item);
                auto key = state.key;
                loaded.insert_or_assign(std::move(key), std::move(state));
            }
        }

        std::uint64_t end = 0;
        std::size_t lines = 0;
        if (has_journal) {
            auto text = read_whole(journal);
            std::size_t pos = 0;
            // A line without its newline was cut short by a crash
            for (auto nl = text.find('\n'); nl != std::string::npos; nl = text.find('\n', pos)) {
                std::string_view line(text.data() + pos, nl - pos);
                pos = nl + 1;
                if (line.empty()) {
                    continue;
                }
                json item = json::parse(line.begin(), line.end(), nullptr, false);
                if (item.is_discarded() || !item.is_object()) {
                    return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
                }
                auto state = from_json(item);
                auto key = state.key;
                loaded.insert_or_assign(std::move(key), std::move(state));
                ++lines;
            }
            end = pos;
            if (end != text.size()) {
                spdlog::warn("progress journal {}: ignoring {} trailing byte(s)",
                             journal.string(), text.size() - end);
            }
        }

        records_ = loaded;
        journal_end_ = end;
        journal_lines_ = lines;
        return loaded;
    } catch (const json::exception& e) {
        spdlog::debug("progress store {}: {}", path_.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    } catch (const std::invalid_argument&) {
        return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code ProgressStore::record(const TransferState& state) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        records_.insert_or_assign(state.key, state);
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return append_locked(state);
}

std::error_code ProgressStore::compact() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return compact_locked();
}

std::error_code ProgressStore::reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    journal_.close();
    journal_end_ = 0;
    journal_lines_ = 0;

    // Journal first: a snapshot without its journal is still consistent
    std::error_code ec;
    fs::remove(journal_path(), ec);
    if (!ec) {
        fs::remove(path_, ec);
    }
    if (ec) {
        return disk::errno_to_error_code(ec.value(), disk::DiskErrc::write_error);
    }
    return {};
}

StateMap ProgressStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::error_code ProgressStore::append_locked(const TransferState& state) noexcept {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        // First write of a run context starts the snapshot
        return compact_locked();
    }

    try {
        if (!journal_.is_open()) {
            const auto journal = journal_path();
            auto end = journal_end_.value_or(disk::file_size_or_zero(journal));
            if (auto open_ec = journal_.open(journal, end)) {
                return open_ec;
            }
            journal_end_ = end;
        }

        std::string line = to_json(state).dump();
        line += '\n';
        if (auto write_ec = journal_.write(line.data(), line.size())) {
            // Drop the partial line so the next append starts clean
            if (auto trunc_ec = journal_.truncate(*journal_end_)) {
                spdlog::warn("progress journal {}: {}", journal_.path().string(), trunc_ec.message());
                journal_.close();
                journal_end_.reset();
            }
            return write_ec;
        }
        if (auto sync_ec = journal_.sync()) {
            return sync_ec;
        }
        journal_end_ = journal_.offset();
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }

    if (++journal_lines_ >= std::max(compact_threshold_, records_.size())) {
        return compact_locked();
    }
    return {};
}

std::error_code ProgressStore::compact_locked() noexcept {
    try {
        json doc;
        doc["version"] = FORMAT_VERSION;
        doc["source"] = source_;
        doc["updated_at"] = utc_timestamp();
        json records = json::array();
        for (const auto& [key, state] : records_) {
            records.push_back(to_json(state));
        }
        doc["records"] = std::move(records);

        if (auto ec = disk::write_atomically(path_, doc.dump(2))) {
            return ec;
        }
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }

    // A crash here replays records the snapshot already holds
    journal_.close();
    journal_end_ = 0;
    journal_lines_ = 0;
    std::error_code ec;
    fs::remove(journal_path(), ec);
    if (ec) {
        return disk::errno_to_error_code(ec.value(), disk::DiskErrc::write_error);
    }
    return {};
}

} // namespace bucketdl::core
