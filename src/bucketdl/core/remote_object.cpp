// Copyright (c) 2026 changcheng967. All rights reserved.

#include <bucketdl/core/remote_object.hpp>

namespace bucketdl::core {

std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::pending:     return "pending";
        case TransferStatus::in_progress: return "in-progress";
        case TransferStatus::verifying:   return "verifying";
        case TransferStatus::completed:   return "completed";
        case TransferStatus::failed:      return "failed";
        case TransferStatus::skipped:     return "skipped";
    }
    return "unknown";
}

std::optional<TransferStatus> status_from_string(std::string_view name) noexcept {
    if (name == "pending")     return TransferStatus::pending;
    if (name == "in-progress") return TransferStatus::in_progress;
    if (name == "verifying")   return TransferStatus::verifying;
    if (name == "completed")   return TransferStatus::completed;
    if (name == "failed")      return TransferStatus::failed;
    if (name == "skipped")     return TransferStatus::skipped;
    return std::nullopt;
}

} // namespace bucketdl::core
