#pragma once

#include "batch_plan.h"
#include "transfer_outcome.h"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bucketpull::core {

// Outcomes in plan order, one per task.
class BatchReport {
public:
    BatchReport() = default;
    BatchReport(std::string batch_id, std::vector<TransferOutcome> outcomes);

    const std::string& batch_id() const { return batch_id_; }
    const std::vector<TransferOutcome>& outcomes() const { return outcomes_; }
    std::size_t size() const { return outcomes_.size(); }
    bool empty() const { return outcomes_.empty(); }

    const TransferOutcome* Find(const TransferTask& task) const;

    std::size_t CountSucceeded() const { return count(TransferStatus::kSuccess); }
    std::size_t CountSkipped() const { return count(TransferStatus::kSkipped); }
    std::size_t CountFailed() const { return count(TransferStatus::kFailed); }
    bool WasCancelled() const;

    std::vector<TransferOutcome> Failures() const;

    // Plan made of the failed tasks only, for a targeted re-run.
    BatchPlan RetryPlan() const;

    // Counts followed by one line per failure (kind + source path).
    std::string Summary() const;

    friend void to_json(nlohmann::json& j, const BatchReport& report);
    friend void from_json(const nlohmann::json& j, BatchReport& report);

private:
    std::size_t count(TransferStatus status) const;

    std::string batch_id_;
    std::vector<TransferOutcome> outcomes_;
};

} // namespace bucketpull::core
