#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <condition_variable>
#include <core/batch/batch_result_collector.h>
#include <core/batch/scheduler.h>
#include <core/progress/progress_aggregator.h>
#include <core/progress/progress_monitor.h>
#include <core/util/error.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

namespace net = boost::asio;

namespace bucketpull::core {

namespace {

feedback::BatchProgress toBatchProgress(const std::string& batch_id,
                                        const ProgressSnapshot& snapshot) {
    return feedback::BatchProgress{
        .batch_id = batch_id,
        .observed_bytes = snapshot.observed_bytes,
        .total_bytes = snapshot.total_bytes.value_or(0),
        .total_known = snapshot.total_bytes.has_value(),
        .completed_tasks = snapshot.completed_tasks,
        .total_tasks = snapshot.total_tasks,
        .fraction = snapshot.fraction,
    };
}

bool wantsEstimate(SizeEstimation mode, TransferKind kind) {
    switch (mode) {
    case SizeEstimation::kNone:
        return false;
    case SizeEstimation::kFiles:
        return kind == TransferKind::kFile;
    case SizeEstimation::kAll:
        return true;
    }
    return false;
}

} // namespace

Scheduler::Scheduler(TransferMechanism& mechanism,
                     SchedulerOptions options,
                     FeedbackCallback callback)
    : mechanism_(mechanism)
    , invoker_(mechanism)
    , options_(options)
    , callback_(std::move(callback)) {
    if (options_.max_parallel < 1) {
        throw ConfigError("max-parallel must be at least 1, got "
                          + std::to_string(options_.max_parallel));
    }
    if (options_.poll_interval.count() <= 0 || options_.render_interval.count() <= 0) {
        throw ConfigError("progress intervals must be positive");
    }
}

std::vector<std::optional<std::uint64_t>> Scheduler::estimateSizes(const BatchPlan& plan,
                                                                   std::stop_token stop_token) {
    std::vector<std::optional<std::uint64_t>> estimates(plan.size());
    if (options_.size_estimation == SizeEstimation::kNone) {
        return estimates;
    }

    auto workers = std::min<std::size_t>(static_cast<std::size_t>(options_.max_parallel),
                                         plan.size());
    net::thread_pool pool(workers);
    for (std::size_t i = 0; i < plan.size(); ++i) {
        if (!wantsEstimate(options_.size_estimation, plan[i].kind)) {
            continue;
        }
        net::post(pool, [this, &plan, &estimates, stop_token, i]() {
            if (stop_token.stop_requested()) {
                return;
            }
            try {
                estimates[i] = mechanism_.EstimateSize(plan[i], stop_token);
            } catch (const std::exception& e) {
                spdlog::warn("Size lookup for {} failed: {}", plan[i].source_path, e.what());
            }
        });
    }
    pool.join();
    return estimates;
}

void Scheduler::feedback(Feedback&& feedback) noexcept {
    if (!callback_) {
        return;
    }
    const auto type = feedback.type;
    try {
        callback_(std::move(feedback));
    } catch (const std::exception& e) {
        spdlog::error("Feedback consumer failed on event {}: {}", static_cast<int>(type), e.what());
    }
}

BatchReport Scheduler::Run(const BatchPlan& plan, std::stop_token stop_token) {
    boost::uuids::random_generator uuid_gen;
    const std::string batch_id = boost::uuids::to_string(uuid_gen());
    spdlog::info("Batch {}: {} task(s), max parallel {}",
                 batch_id,
                 plan.size(),
                 options_.max_parallel);

    feedback(Feedback{.type = FeedbackType::kBatchStarted,
                      .data = feedback::BatchStarted{
                          .batch_id = batch_id,
                          .total_tasks = plan.size(),
                          .max_parallel = options_.max_parallel,
                      }});

    BatchResultCollector collector(plan, batch_id);
    if (plan.empty()) {
        auto report = collector.Finalize();
        feedback(Feedback{.type = FeedbackType::kBatchFinished,
                          .data = feedback::BatchFinished{.batch_id = batch_id,
                                                          .succeeded = 0,
                                                          .skipped = 0,
                                                          .failed = 0,
                                                          .cancelled = false}});
        return report;
    }

    auto estimates = estimateSizes(plan, stop_token);
    ProgressAggregator aggregator(estimates);

    std::jthread renderer([this, &aggregator, &batch_id](std::stop_token render_stop) {
        std::mutex mutex;
        std::condition_variable_any cv;
        while (!render_stop.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(mutex);
                if (cv.wait_for(lock, render_stop, options_.render_interval, [] { return false; })
                    || render_stop.stop_requested()) {
                    break;
                }
            }
            feedback(Feedback{.type = FeedbackType::kBatchProgress,
                              .data = toBatchProgress(batch_id, aggregator.Snapshot())});
        }
    });

    auto run_task = [&](std::size_t index) {
        const auto& task = plan[index];
        TransferOutcome outcome;

        if (stop_token.stop_requested()) {
            outcome = TransferOutcome::Cancelled(task);
        } else {
            feedback(Feedback{.type = FeedbackType::kTaskStarted,
                              .data = feedback::TaskStarted{
                                  .batch_id = batch_id,
                                  .index = index,
                                  .task = task,
                                  .total_bytes = estimates[index].value_or(0),
                                  .total_known = estimates[index].has_value(),
                              }});

            ProgressMonitor monitor(task,
                                    estimates[index],
                                    options_.poll_interval,
                                    [&, index](const ProgressSample& sample) {
                                        aggregator.Observe(index, sample.observed_bytes);
                                        feedback(Feedback{
                                            .type = FeedbackType::kTaskProgress,
                                            .data = feedback::TaskProgress{
                                                .batch_id = batch_id,
                                                .index = index,
                                                .source_path = sample.task.source_path,
                                                .observed_bytes = sample.observed_bytes,
                                                .total_bytes = sample.estimated_total_bytes
                                                                   .value_or(0),
                                                .total_known = sample.estimated_total_bytes
                                                                   .has_value(),
                                            }});
                                    });
            monitor.Start(stop_token);
            try {
                outcome = invoker_.Execute(task, std::max(task.thread_hint, 1), stop_token);
            } catch (const std::exception& e) {
                spdlog::error("Task {} aborted: {}", task.source_path, e.what());
                outcome = TransferOutcome::Failed(task, ErrorKind::kUnknown, e.what());
            }
            monitor.Stop();
            aggregator.Observe(index, monitor.LastObservedBytes());
        }

        aggregator.Complete(index, outcome.status == TransferStatus::kFailed
                                       ? std::nullopt
                                       : std::optional<std::uint64_t>(
                                           estimates[index].value_or(0)));
        feedback(Feedback{.type = FeedbackType::kTaskFinished,
                          .data = feedback::TaskFinished{
                              .batch_id = batch_id,
                              .index = index,
                              .outcome = outcome,
                          }});
        collector.Record(std::move(outcome));
    };

    {
        auto workers = std::min<std::size_t>(static_cast<std::size_t>(options_.max_parallel),
                                             plan.size());
        net::thread_pool pool(workers);
        for (std::size_t i = 0; i < plan.size(); ++i) {
            net::post(pool, [&run_task, i]() { run_task(i); });
        }
        pool.join();
    }

    renderer.request_stop();
    renderer.join();
    feedback(Feedback{.type = FeedbackType::kBatchProgress,
                      .data = toBatchProgress(batch_id, aggregator.Snapshot())});

    auto report = collector.Finalize();
    spdlog::info("Batch {} finished: {}", batch_id, report.Summary());
    feedback(Feedback{.type = FeedbackType::kBatchFinished,
                      .data = feedback::BatchFinished{
                          .batch_id = batch_id,
                          .succeeded = report.CountSucceeded(),
                          .skipped = report.CountSkipped(),
                          .failed = report.CountFailed(),
                          .cancelled = report.WasCancelled(),
                      }});
    return report;
}

} // namespace bucketpull::core
