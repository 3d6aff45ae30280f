#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/batch_plan.h>
#include <core/model/batch_report.h>
#include <core/model/feedback.h>
#include <core/model/size_estimation.h>
#include <core/transfer/transfer_invoker.h>
#include <core/transfer/transfer_mechanism.h>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <vector>

namespace bucketpull::core {

struct SchedulerOptions {
    int max_parallel = transfer::kDefaultMaxParallel;
    std::chrono::milliseconds poll_interval = transfer::kDefaultPollInterval;
    std::chrono::milliseconds render_interval = transfer::kDefaultRenderInterval;
    SizeEstimation size_estimation = SizeEstimation::kFiles;
};

// Runs a BatchPlan on at most max_parallel workers. Each running task gets
// its own ProgressMonitor; failures stay inside their task's outcome.
class Scheduler {
public:
    // Throws ConfigError when max_parallel < 1 or an interval is not positive.
    Scheduler(TransferMechanism& mechanism,
              SchedulerOptions options = {},
              FeedbackCallback callback = nullptr);
    ~Scheduler() = default;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Returns once every task has a terminal outcome. After a stop request no
    // new task starts, running ones are terminated, and every task without a
    // Success/Skipped outcome is reported Failed(Cancelled).
    BatchReport Run(const BatchPlan& plan, std::stop_token stop_token = {});

    const SchedulerOptions& options() const { return options_; }

private:
    std::vector<std::optional<std::uint64_t>> estimateSizes(const BatchPlan& plan,
                                                            std::stop_token stop_token);

    TransferMechanism& mechanism_;
    TransferInvoker invoker_;
    SchedulerOptions options_;
    FeedbackCallback callback_;

    // A throwing consumer is logged and otherwise ignored; it must not end the
    // batch from inside a worker.
    void feedback(Feedback&& feedback) noexcept;
};

} // namespace bucketpull::core
