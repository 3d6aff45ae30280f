#include <core/batch/batch_result_collector.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace bucketpull::core;

namespace {

BatchPlan makePlan(std::size_t count) {
    std::vector<TransferTask> tasks;
    for (std::size_t i = 0; i < count; ++i) {
        tasks.push_back(TransferTask{.source_path = "gs://bucket/f" + std::to_string(i),
                                     .destination_path = "/dl/f" + std::to_string(i)});
    }
    return BatchPlan(std::move(tasks));
}

} // namespace

TEST(BatchResultCollectorTest, FinalizeKeepsPlanOrder) {
    auto plan = makePlan(3);
    BatchResultCollector collector(plan, "batch-1");
    collector.Record(TransferOutcome::Skipped(plan[2]));
    collector.Record(TransferOutcome::Succeeded(plan[0], 10));
    EXPECT_FALSE(collector.IsComplete());
    collector.Record(TransferOutcome::Failed(plan[1], ErrorKind::kNetworkFailure, "reset"));
    EXPECT_TRUE(collector.IsComplete());

    auto report = collector.Finalize();
    EXPECT_EQ(report.batch_id(), "batch-1");
    ASSERT_EQ(report.size(), 3u);
    for (std::size_t i = 0; i < plan.size(); ++i) {
        EXPECT_EQ(report.outcomes()[i].task, plan[i]);
    }
    EXPECT_EQ(report.outcomes()[1].error_kind, ErrorKind::kNetworkFailure);
}

TEST(BatchResultCollectorTest, SecondOutcomeForATaskIsRejected) {
    auto plan = makePlan(1);
    BatchResultCollector collector(plan);
    collector.Record(TransferOutcome::Succeeded(plan[0]));
    EXPECT_THROW(collector.Record(TransferOutcome::Skipped(plan[0])), std::logic_error);
    EXPECT_EQ(collector.RecordedCount(), 1u);
}

TEST(BatchResultCollectorTest, TaskOutsideThePlanIsRejected) {
    auto plan = makePlan(1);
    BatchResultCollector collector(plan);
    TransferTask stranger{.source_path = "gs://other/x", .destination_path = "/dl/x"};
    EXPECT_THROW(collector.Record(TransferOutcome::Succeeded(stranger)), std::logic_error);
}

TEST(BatchResultCollectorTest, FinalizeWhilePendingThrows) {
    auto plan = makePlan(2);
    BatchResultCollector collector(plan);
    collector.Record(TransferOutcome::Succeeded(plan[0]));
    EXPECT_THROW(collector.Finalize(), std::logic_error);
}

TEST(BatchResultCollectorTest, EmptyPlanFinalizesImmediately) {
    BatchPlan plan;
    BatchResultCollector collector(plan);
    EXPECT_TRUE(collector.IsComplete());
    EXPECT_TRUE(collector.Finalize().empty());
}

TEST(BatchResultCollectorTest, ConcurrentRecordsAllLand) {
    auto plan = makePlan(64);
    BatchResultCollector collector(plan);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < 4; ++t) {
        threads.emplace_back([&plan, &collector, t]() {
            for (std::size_t i = t; i < plan.size(); i += 4) {
                collector.Record(TransferOutcome::Succeeded(plan[i]));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_TRUE(collector.IsComplete());
    EXPECT_EQ(collector.Finalize().CountSucceeded(), 64u);
}
