#include "fakes/temp_dir.h"
#include <chrono>
#include <core/progress/progress_monitor.h>
#include <core/util/disk_usage.h>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace bucketpull::core;
using bucketpull::test::TempDir;
using bucketpull::test::WriteBytes;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST(DiskUsageTest, MissingPathMeasuresZero) {
    TempDir dir;
    EXPECT_EQ(MeasureDiskUsage(dir.path() / "missing"), 0u);
}

TEST(DiskUsageTest, SumsFilesRecursively) {
    TempDir dir;
    WriteBytes(dir.path() / "a.bin", 100);
    WriteBytes(dir.path() / "sub" / "b.bin", 50);
    WriteBytes(dir.path() / "sub" / "deeper" / "c.bin", 25);
    EXPECT_EQ(MeasureDiskUsage(dir.path()), 175u);
    EXPECT_EQ(MeasureDiskUsage(dir.path() / "a.bin"), 100u);
}

TEST(ProgressMonitorTest, ReportsGrowthMonotonically) {
    TempDir dir;
    auto file = dir.path() / "download.bin";
    TransferTask task{.source_path = "gs://bucket/download.bin",
                      .destination_path = file.string()};

    std::mutex mutex;
    std::vector<ProgressSample> samples;
    ProgressMonitor monitor(task, 300, 10ms, [&](const ProgressSample& sample) {
        std::lock_guard lock(mutex);
        samples.push_back(sample);
    });
    monitor.Start();
    EXPECT_TRUE(monitor.IsRunning());

    WriteBytes(file, 100);
    ASSERT_TRUE(waitUntil([&] { return monitor.LastObservedBytes() == 100; }));
    WriteBytes(file, 200, true);
    ASSERT_TRUE(waitUntil([&] { return monitor.LastObservedBytes() == 300; }));
    monitor.Stop();
    EXPECT_FALSE(monitor.IsRunning());

    std::lock_guard lock(mutex);
    ASSERT_FALSE(samples.empty());
    for (std::size_t i = 1; i < samples.size(); ++i) {
        EXPECT_GE(samples[i].observed_bytes, samples[i - 1].observed_bytes);
        EXPECT_GE(samples[i].timestamp, samples[i - 1].timestamp);
    }
    EXPECT_EQ(samples.back().observed_bytes, 300u);
    ASSERT_TRUE(samples.back().estimated_total_bytes);
    EXPECT_EQ(*samples.back().estimated_total_bytes, 300u);
    ASSERT_TRUE(samples.back().Fraction());
    EXPECT_DOUBLE_EQ(*samples.back().Fraction(), 1.0);
}

TEST(ProgressMonitorTest, NoSamplesAfterStop) {
    TempDir dir;
    auto file = dir.path() / "download.bin";
    TransferTask task{.source_path = "gs://bucket/download.bin",
                      .destination_path = file.string()};

    ProgressMonitor monitor(task, std::nullopt, 5ms, nullptr);
    monitor.Start();
    ASSERT_TRUE(waitUntil([&] { return monitor.SampleCount() >= 1; }));
    monitor.Stop();

    auto count = monitor.SampleCount();
    WriteBytes(file, 1000);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(monitor.SampleCount(), count);
    EXPECT_EQ(monitor.LastObservedBytes(), 0u);
}

TEST(ProgressMonitorTest, UnknownTotalHasNoFraction) {
    ProgressSample sample{.task = {}, .observed_bytes = 10, .estimated_total_bytes = std::nullopt};
    EXPECT_FALSE(sample.Fraction());
}

TEST(ProgressMonitorTest, BatchStopEndsSampling) {
    TempDir dir;
    TransferTask task{.source_path = "gs://bucket/folder/",
                      .destination_path = (dir.path() / "folder").string(),
                      .kind = TransferKind::kFolder};

    std::stop_source batch;
    ProgressMonitor monitor(task, std::nullopt, 1000ms, nullptr);
    monitor.Start(batch.get_token());
    ASSERT_TRUE(waitUntil([&] { return monitor.SampleCount() >= 1; }));

    auto started = std::chrono::steady_clock::now();
    batch.request_stop();
    EXPECT_TRUE(waitUntil([&] { return !monitor.IsRunning(); }, 500ms));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 900ms);
    monitor.Stop();
}
