#include <core/model/batch_report.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace bucketpull::core;
using json = nlohmann::json;

namespace {

TransferTask task(const std::string& name) {
    return TransferTask{.source_path = "gs://bucket/" + name,
                        .destination_path = "/dl/" + name,
                        .kind = TransferKind::kFile,
                        .thread_hint = 8};
}

BatchReport sampleReport() {
    return BatchReport("id-1",
                       {
                           TransferOutcome::Succeeded(task("a"), 100),
                           TransferOutcome::Skipped(task("b")),
                           TransferOutcome::Failed(task("c"),
                                                   ErrorKind::kPermissionDenied,
                                                   "AccessDeniedException: 403"),
                       });
}

} // namespace

TEST(BatchReportTest, Counts) {
    auto report = sampleReport();
    EXPECT_EQ(report.CountSucceeded(), 1u);
    EXPECT_EQ(report.CountSkipped(), 1u);
    EXPECT_EQ(report.CountFailed(), 1u);
    EXPECT_FALSE(report.WasCancelled());
    ASSERT_NE(report.Find(task("b")), nullptr);
    EXPECT_EQ(report.Find(task("b"))->status, TransferStatus::kSkipped);
    EXPECT_EQ(report.Find(task("z")), nullptr);
}

TEST(BatchReportTest, SummaryListsEachFailure) {
    auto summary = sampleReport().Summary();
    EXPECT_NE(summary.find("1 succeeded, 1 skipped, 1 failed"), std::string::npos);
    EXPECT_NE(summary.find("[PermissionDenied] gs://bucket/c -> /dl/c: AccessDeniedException: 403"),
              std::string::npos);
    EXPECT_EQ(summary.find("gs://bucket/a"), std::string::npos);
}

TEST(BatchReportTest, SummaryWithoutFailuresIsOneLine) {
    BatchReport report("id", {TransferOutcome::Succeeded(task("a"))});
    EXPECT_EQ(report.Summary(), "1 succeeded, 0 skipped, 0 failed");
}

TEST(BatchReportTest, RetryPlanHoldsOnlyFailedTasks) {
    auto plan = sampleReport().RetryPlan();
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], task("c"));
    EXPECT_EQ(plan[0].thread_hint, 8);
}

TEST(BatchReportTest, CancelledOutcomesMarkTheBatch) {
    BatchReport report("id", {TransferOutcome::Cancelled(task("a"))});
    EXPECT_TRUE(report.WasCancelled());
    EXPECT_EQ(report.outcomes()[0].error_detail, "cancelled");
}

TEST(BatchReportTest, JsonKeepsFailuresForARetry) {
    json j = sampleReport();
    EXPECT_EQ(j["batch_id"], "id-1");
    EXPECT_EQ(j["failed"], 1);
    EXPECT_EQ(j["outcomes"][2]["status"], "Failed");
    EXPECT_EQ(j["outcomes"][2]["error_kind"], "PermissionDenied");
    EXPECT_EQ(j["outcomes"][0]["bytes_transferred"], 100);
    EXPECT_FALSE(j["outcomes"][1].contains("error_detail"));

    auto restored = json::parse(j.dump()).get<BatchReport>();
    EXPECT_EQ(restored.batch_id(), "id-1");
    auto retry = restored.RetryPlan();
    ASSERT_EQ(retry.size(), 1u);
    EXPECT_EQ(retry[0].source_path, "gs://bucket/c");
    EXPECT_EQ(restored.outcomes()[2].error_detail, "AccessDeniedException: 403");
}
