#pragma once

#include "transfer_task.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace bucketpull::core {

enum class TransferStatus {
    kSuccess, // the mechanism copied at least one item
    kSkipped, // everything already existed at the destination
    kFailed,
};

enum class ErrorKind {
    kNone,
    kBucketOrPathNotFound,
    kPermissionDenied,
    kNetworkFailure,
    kDestinationUnwritable,
    kCancelled,
    kUnknown,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferStatus,
                             {
                                 {TransferStatus::kSuccess, "Success"},
                                 {TransferStatus::kSkipped, "Skipped"},
                                 {TransferStatus::kFailed, "Failed"},
                             });

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind,
                             {
                                 {ErrorKind::kNone, "None"},
                                 {ErrorKind::kBucketOrPathNotFound, "BucketOrPathNotFound"},
                                 {ErrorKind::kPermissionDenied, "PermissionDenied"},
                                 {ErrorKind::kNetworkFailure, "NetworkFailure"},
                                 {ErrorKind::kDestinationUnwritable, "DestinationUnwritable"},
                                 {ErrorKind::kCancelled, "Cancelled"},
                                 {ErrorKind::kUnknown, "Unknown"},
                             });

struct TransferOutcome {
    TransferTask task;
    TransferStatus status{TransferStatus::kFailed};
    ErrorKind error_kind{ErrorKind::kNone};
    std::optional<std::string> error_detail;
    std::optional<std::uint64_t> bytes_transferred;

    static TransferOutcome Succeeded(const TransferTask& task,
                                     std::optional<std::uint64_t> bytes = std::nullopt);
    static TransferOutcome Skipped(const TransferTask& task);
    static TransferOutcome Failed(const TransferTask& task, ErrorKind kind, std::string detail);
    static TransferOutcome Cancelled(const TransferTask& task);

    bool IsCancelled() const { return error_kind == ErrorKind::kCancelled; }
};

void to_json(nlohmann::json& j, const TransferOutcome& outcome);
void from_json(const nlohmann::json& j, TransferOutcome& outcome);

std::string_view TransferStatusToString(TransferStatus status);
std::string_view ErrorKindToString(ErrorKind kind);

} // namespace bucketpull::core
