#include <core/model/transfer_outcome.h>
#include <core/model/transfer_task.h>

using json = nlohmann::json;

namespace bucketpull::core {

std::string_view TransferKindToString(TransferKind kind) {
    switch (kind) {
    case TransferKind::kFile:
        return "File";
    case TransferKind::kFolder:
        return "Folder";
    }
    return "Unknown";
}

std::string_view TransferStatusToString(TransferStatus status) {
    switch (status) {
    case TransferStatus::kSuccess:
        return "Success";
    case TransferStatus::kSkipped:
        return "Skipped";
    case TransferStatus::kFailed:
        return "Failed";
    }
    return "Unknown";
}

std::string_view ErrorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kNone:
        return "None";
    case ErrorKind::kBucketOrPathNotFound:
        return "BucketOrPathNotFound";
    case ErrorKind::kPermissionDenied:
        return "PermissionDenied";
    case ErrorKind::kNetworkFailure:
        return "NetworkFailure";
    case ErrorKind::kDestinationUnwritable:
        return "DestinationUnwritable";
    case ErrorKind::kCancelled:
        return "Cancelled";
    case ErrorKind::kUnknown:
        return "Unknown";
    }
    return "Unknown";
}

TransferOutcome TransferOutcome::Succeeded(const TransferTask& task,
                                           std::optional<std::uint64_t> bytes) {
    return TransferOutcome{
        .task = task,
        .status = TransferStatus::kSuccess,
        .error_kind = ErrorKind::kNone,
        .error_detail = std::nullopt,
        .bytes_transferred = bytes,
    };
}

TransferOutcome TransferOutcome::Skipped(const TransferTask& task) {
    return TransferOutcome{
        .task = task,
        .status = TransferStatus::kSkipped,
        .error_kind = ErrorKind::kNone,
        .error_detail = std::nullopt,
        .bytes_transferred = 0,
    };
}

TransferOutcome TransferOutcome::Failed(const TransferTask& task,
                                        ErrorKind kind,
                                        std::string detail) {
    return TransferOutcome{
        .task = task,
        .status = TransferStatus::kFailed,
        .error_kind = kind,
        .error_detail = std::move(detail),
        .bytes_transferred = std::nullopt,
    };
}

TransferOutcome TransferOutcome::Cancelled(const TransferTask& task) {
    return Failed(task, ErrorKind::kCancelled, "cancelled");
}

void to_json(json& j, const TransferOutcome& outcome) {
    j = json{
        {"task", outcome.task},
        {"status", outcome.status},
        {"error_kind", outcome.error_kind},
    };
    if (outcome.error_detail) {
        j["error_detail"] = *outcome.error_detail;
    }
    if (outcome.bytes_transferred) {
        j["bytes_transferred"] = *outcome.bytes_transferred;
    }
}

void from_json(const json& j, TransferOutcome& outcome) {
    j.at("task").get_to(outcome.task);
    j.at("status").get_to(outcome.status);
    outcome.error_kind = j.value("error_kind", ErrorKind::kNone);
    if (j.contains("error_detail")) {
        outcome.error_detail = j["error_detail"].get<std::string>();
    } else {
        outcome.error_detail.reset();
    }
    if (j.contains("bytes_transferred")) {
        outcome.bytes_transferred = j["bytes_transferred"].get<std::uint64_t>();
    } else {
        outcome.bytes_transferred.reset();
    }
}

} // namespace bucketpull::core
