#pragma once

#include <atomic>
#include <chrono>
#include <core/model/progress_sample.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <thread>

namespace bucketpull::core {

// Samples the on-disk size of one task's destination on its own thread while
// the task runs. Stop() returns only after the sampling thread has exited, so
// no sample is delivered afterwards.
class ProgressMonitor {
public:
    ProgressMonitor(TransferTask task,
                    std::optional<std::uint64_t> estimated_total_bytes,
                    std::chrono::milliseconds interval,
                    ProgressSampleCallback callback);
    ~ProgressMonitor();
    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // A stop on batch_token stops this monitor as well.
    void Start(std::stop_token batch_token = {});

    void Stop();

    bool IsRunning() const { return running_.load(); }

    std::uint64_t LastObservedBytes() const { return last_observed_.load(); }

    std::size_t SampleCount() const { return sample_count_.load(); }

private:
    void run(std::stop_token stop_token);
    void emit(std::uint64_t observed_bytes);

    TransferTask task_;
    std::optional<std::uint64_t> estimated_total_bytes_;
    std::chrono::milliseconds interval_;
    ProgressSampleCallback callback_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> last_observed_{0};
    std::atomic<std::size_t> sample_count_{0};

    std::optional<std::stop_callback<std::function<void()>>> batch_link_;
    std::jthread worker_;
};

} // namespace bucketpull::core
