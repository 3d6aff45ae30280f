#pragma once

#include <core/model/batch_plan.h>
#include <core/model/remote_entry.h>
#include <core/model/selection.h>
#include <filesystem>
#include <string>

namespace bucketpull::core {

// Turns a selection into a BatchPlan. All validation happens here, before any
// transfer starts; every problem is reported as PlanningError.
class TaskPlanner {
public:
    TaskPlanner(std::filesystem::path destination_root, int thread_hint);

    BatchPlan Plan(const Selection& selection, const RemoteListing& listing) const;

    const std::filesystem::path& destination_root() const { return destination_root_; }

private:
    const RemoteEntry& resolve(const RemoteListing& listing,
                               const std::string& path,
                               TransferKind expected_kind) const;
    TransferTask makeTask(const RemoteListing& listing, const RemoteEntry& entry) const;

    std::filesystem::path destination_root_;
    int thread_hint_;
};

} // namespace bucketpull::core
