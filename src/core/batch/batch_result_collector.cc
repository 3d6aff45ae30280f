#include <core/batch/batch_result_collector.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace bucketpull::core {

BatchResultCollector::BatchResultCollector(const BatchPlan& plan, std::string batch_id)
    : batch_id_(std::move(batch_id))
    , outcomes_(plan.size()) {
    for (std::size_t i = 0; i < plan.size(); ++i) {
        index_.emplace(TaskKey{plan[i].source_path, plan[i].destination_path}, i);
    }
}

void BatchResultCollector::Record(TransferOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(TaskKey{outcome.task.source_path, outcome.task.destination_path});
    if (it == index_.end()) {
        throw std::logic_error("outcome recorded for a task outside the plan: "
                               + outcome.task.source_path);
    }
    auto& slot = outcomes_[it->second];
    if (slot) {
        throw std::logic_error("second outcome recorded for " + outcome.task.source_path);
    }
    spdlog::debug("Recorded {} for {}",
                  TransferStatusToString(outcome.status),
                  outcome.task.source_path);
    slot = std::move(outcome);
    ++recorded_;
}

bool BatchResultCollector::IsComplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorded_ == outcomes_.size();
}

std::size_t BatchResultCollector::RecordedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorded_;
}

BatchReport BatchResultCollector::Finalize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recorded_ != outcomes_.size()) {
        throw std::logic_error("batch finalized with " + std::to_string(outcomes_.size() - recorded_)
                               + " task(s) still pending");
    }
    std::vector<TransferOutcome> outcomes;
    outcomes.reserve(outcomes_.size());
    for (const auto& outcome : outcomes_) {
        outcomes.push_back(*outcome);
    }
    return BatchReport(batch_id_, std::move(outcomes));
}

} // namespace bucketpull::core
