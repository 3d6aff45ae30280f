#include <algorithm>
#include <core/model/batch_report.h>
#include <iterator>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace bucketpull::core {

BatchReport::BatchReport(std::string batch_id, std::vector<TransferOutcome> outcomes)
    : batch_id_(std::move(batch_id))
    , outcomes_(std::move(outcomes)) {}

const TransferOutcome* BatchReport::Find(const TransferTask& task) const {
    auto it = std::find_if(outcomes_.begin(), outcomes_.end(), [&task](const auto& outcome) {
        return outcome.task == task;
    });
    return it == outcomes_.end() ? nullptr : &*it;
}

bool BatchReport::WasCancelled() const {
    return std::any_of(outcomes_.begin(), outcomes_.end(), [](const auto& outcome) {
        return outcome.IsCancelled();
    });
}

std::vector<TransferOutcome> BatchReport::Failures() const {
    std::vector<TransferOutcome> failures;
    std::copy_if(outcomes_.begin(),
                 outcomes_.end(),
                 std::back_inserter(failures),
                 [](const auto& outcome) { return outcome.status == TransferStatus::kFailed; });
    return failures;
}

BatchPlan BatchReport::RetryPlan() const {
    std::vector<TransferTask> tasks;
    for (const auto& outcome : outcomes_) {
        if (outcome.status == TransferStatus::kFailed) {
            tasks.push_back(outcome.task);
        }
    }
    return BatchPlan(std::move(tasks));
}

std::string BatchReport::Summary() const {
    std::string summary = fmt::format("{} succeeded, {} skipped, {} failed",
                                      CountSucceeded(),
                                      CountSkipped(),
                                      CountFailed());
    auto failures = Failures();
    if (failures.empty()) {
        return summary;
    }
    summary += "\nFailed transfers:";
    for (const auto& failure : failures) {
        summary += fmt::format("\n  - [{}] {} -> {}",
                               ErrorKindToString(failure.error_kind),
                               failure.task.source_path,
                               failure.task.destination_path);
        if (failure.error_detail && !failure.error_detail->empty()) {
            summary += fmt::format(": {}", *failure.error_detail);
        }
    }
    return summary;
}

std::size_t BatchReport::count(TransferStatus status) const {
    return static_cast<std::size_t>(
        std::count_if(outcomes_.begin(), outcomes_.end(), [status](const auto& outcome) {
            return outcome.status == status;
        }));
}

void to_json(json& j, const BatchReport& report) {
    j = json{
        {"batch_id", report.batch_id_},
        {"succeeded", report.CountSucceeded()},
        {"skipped", report.CountSkipped()},
        {"failed", report.CountFailed()},
        {"outcomes", report.outcomes_},
    };
}

void from_json(const json& j, BatchReport& report) {
    report.batch_id_ = j.value("batch_id", std::string{});
    j.at("outcomes").get_to(report.outcomes_);
}

} // namespace bucketpull::core
