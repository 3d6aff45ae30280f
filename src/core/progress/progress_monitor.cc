#include <algorithm>
#include <condition_variable>
#include <core/progress/progress_monitor.h>
#include <core/util/disk_usage.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace bucketpull::core {

ProgressMonitor::ProgressMonitor(TransferTask task,
                                 std::optional<std::uint64_t> estimated_total_bytes,
                                 std::chrono::milliseconds interval,
                                 ProgressSampleCallback callback)
    : task_(std::move(task))
    , estimated_total_bytes_(estimated_total_bytes)
    , interval_(interval)
    , callback_(std::move(callback)) {}

ProgressMonitor::~ProgressMonitor() {
    Stop();
}

void ProgressMonitor::Start(std::stop_token batch_token) {
    if (running_.exchange(true)) {
        spdlog::warn("Progress monitor for {} already running", task_.destination_path);
        return;
    }
    worker_ = std::jthread([this](std::stop_token stop_token) { run(stop_token); });
    if (batch_token.stop_possible()) {
        batch_link_.emplace(batch_token, std::function<void()>([this]() {
                                worker_.request_stop();
                            }));
    }
}

void ProgressMonitor::Stop() {
    batch_link_.reset();
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    running_ = false;
}

void ProgressMonitor::run(std::stop_token stop_token) {
    std::mutex mutex;
    std::condition_variable_any cv;
    bool first = true;

    while (!stop_token.stop_requested()) {
        auto reading = MeasureDiskUsage(task_.destination_path);
        if (stop_token.stop_requested()) {
            break;
        }
        if (reading) {
            auto previous = last_observed_.load();
            if (*reading > previous || first) {
                last_observed_ = std::max(previous, *reading);
                emit(last_observed_.load());
                first = false;
            }
        } else {
            spdlog::debug("Could not measure {}, retrying", task_.destination_path);
        }

        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, stop_token, interval_, [] { return false; });
    }
    running_ = false;
}

void ProgressMonitor::emit(std::uint64_t observed_bytes) {
    ++sample_count_;
    if (!callback_) {
        return;
    }
    callback_(ProgressSample{
        .task = task_,
        .observed_bytes = observed_bytes,
        .estimated_total_bytes = estimated_total_bytes_,
        .timestamp = std::chrono::steady_clock::now(),
    });
}

} // namespace bucketpull::core
