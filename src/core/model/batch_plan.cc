#include <core/model/batch_plan.h>
#include <core/util/error.h>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace bucketpull::core {

BatchPlan::BatchPlan(std::vector<TransferTask> tasks)
    : tasks_(std::move(tasks)) {
    std::unordered_set<std::string> destinations;
    for (const auto& task : tasks_) {
        if (!destinations.insert(task.destination_path).second) {
            spdlog::error("Duplicate destination in batch plan: {}", task.destination_path);
            throw PlanningError("two tasks share the destination " + task.destination_path);
        }
    }
}

} // namespace bucketpull::core
