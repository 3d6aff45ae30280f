#pragma once

#include "transfer_task.h"
#include <cstddef>
#include <vector>

namespace bucketpull::core {

// Ordered, immutable list of tasks handed to the Scheduler.
// Construction throws PlanningError when two tasks share a destination.
class BatchPlan {
public:
    using const_iterator = std::vector<TransferTask>::const_iterator;

    BatchPlan() = default;
    explicit BatchPlan(std::vector<TransferTask> tasks);

    const std::vector<TransferTask>& tasks() const { return tasks_; }
    const TransferTask& operator[](std::size_t index) const { return tasks_[index]; }
    std::size_t size() const { return tasks_.size(); }
    bool empty() const { return tasks_.empty(); }
    const_iterator begin() const { return tasks_.begin(); }
    const_iterator end() const { return tasks_.end(); }

private:
    std::vector<TransferTask> tasks_;
};

} // namespace bucketpull::core
