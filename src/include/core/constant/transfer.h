#pragma once

#include <chrono>
#include <string_view>

namespace bucketpull::core {

namespace transfer {

constexpr int kDefaultMaxParallel = 16;
constexpr int kDefaultThreadsPerTransfer = 8;

constexpr std::chrono::milliseconds kDefaultPollInterval{100};
constexpr std::chrono::milliseconds kDefaultRenderInterval{250};

constexpr std::string_view kDefaultTool = "gsutil";
constexpr std::string_view kDefaultSlicedDownloadThreshold = "64M";
constexpr std::string_view kBucketScheme = "gs://";

// Interim per-task progress is capped below 1 so the batch only reaches 100%
// once every task has a terminal outcome.
constexpr double kInterimFractionCap = 0.999;

} // namespace transfer

} // namespace bucketpull::core
