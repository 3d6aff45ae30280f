#pragma once

#include <core/model/batch_plan.h>
#include <core/model/batch_report.h>
#include <core/model/transfer_outcome.h>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bucketpull::core {

// Thread-safe fan-in of per-task outcomes. Recording a second outcome for a
// task, or one for a task outside the plan, throws std::logic_error.
class BatchResultCollector {
public:
    explicit BatchResultCollector(const BatchPlan& plan, std::string batch_id = {});

    void Record(TransferOutcome outcome);

    bool IsComplete() const;
    std::size_t RecordedCount() const;

    // Throws std::logic_error while some task has no outcome yet.
    BatchReport Finalize() const;

private:
    using TaskKey = std::pair<std::string, std::string>;

    std::string batch_id_;
    std::map<TaskKey, std::size_t> index_;
    std::vector<std::optional<TransferOutcome>> outcomes_;
    std::size_t recorded_{0};
    mutable std::mutex mutex_;
};

} // namespace bucketpull::core
