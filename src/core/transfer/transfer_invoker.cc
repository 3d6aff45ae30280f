#include <core/transfer/error_classifier.h>
#include <core/transfer/transfer_invoker.h>
#include <core/util/disk_usage.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <vector>

namespace bucketpull::core {

namespace {

constexpr std::size_t kDetailLines = 3;

// The last few non-empty lines carry the tool's actual complaint.
std::string errorDetail(const std::string& output, int exit_code) {
    std::vector<std::string> lines;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            lines.push_back(line);
        }
    }
    if (lines.empty()) {
        return "exit code " + std::to_string(exit_code);
    }
    std::string detail;
    auto first = lines.size() > kDetailLines ? lines.size() - kDetailLines : 0;
    for (auto i = first; i < lines.size(); ++i) {
        if (!detail.empty()) {
            detail += " | ";
        }
        detail += lines[i];
    }
    return detail;
}

} // namespace

TransferInvoker::TransferInvoker(TransferMechanism& mechanism)
    : mechanism_(mechanism) {}

TransferOutcome TransferInvoker::Execute(const TransferTask& task,
                                         int threads,
                                         std::stop_token stop_token) const {
    if (stop_token.stop_requested()) {
        return TransferOutcome::Cancelled(task);
    }

    std::error_code ec;
    bool existed_before = std::filesystem::exists(task.destination_path, ec);
    auto size_before = MeasureDiskUsage(task.destination_path).value_or(0);

    MechanismResult result;
    try {
        result = mechanism_.Transfer(task, threads, stop_token);
    } catch (const std::exception& e) {
        spdlog::error("Transfer of {} threw: {}", task.source_path, e.what());
        return TransferOutcome::Failed(task, ErrorKind::kUnknown, e.what());
    }

    auto kind = ClassifyError(result.exit_code, result.output, result.terminated);
    if (kind == ErrorKind::kCancelled) {
        spdlog::info("Transfer of {} cancelled", task.source_path);
        return TransferOutcome::Cancelled(task);
    }
    if (kind != ErrorKind::kNone) {
        auto detail = errorDetail(result.output, result.exit_code);
        spdlog::error("Transfer of {} failed ({}): {}",
                      task.source_path,
                      ErrorKindToString(kind),
                      detail);
        return TransferOutcome::Failed(task, kind, std::move(detail));
    }

    auto size_after = MeasureDiskUsage(task.destination_path).value_or(size_before);
    std::uint64_t grown = size_after > size_before ? size_after - size_before : 0;

    bool nothing_copied = result.items_copied ? *result.items_copied == 0
                                              : (existed_before && grown == 0);
    if (nothing_copied) {
        spdlog::info("Skipped {}: already present at {}", task.source_path, task.destination_path);
        return TransferOutcome::Skipped(task);
    }

    spdlog::info("Transferred {} -> {} ({} bytes)",
                 task.source_path,
                 task.destination_path,
                 grown);
    return TransferOutcome::Succeeded(task, grown);
}

} // namespace bucketpull::core
