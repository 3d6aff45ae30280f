#pragma once

#include "temp_dir.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <core/transfer/transfer_mechanism.h>
#include <functional>
#include <mutex>
#include <thread>

namespace bucketpull::test {

// Scriptable TransferMechanism that records how many transfers overlap.
class FakeMechanism : public core::TransferMechanism {
public:
    using Behavior = std::function<core::MechanismResult(const core::TransferTask&,
                                                         int,
                                                         std::stop_token)>;

    explicit FakeMechanism(Behavior behavior, std::optional<std::uint64_t> size = std::nullopt)
        : behavior_(std::move(behavior))
        , size_(size) {}

    core::MechanismResult Transfer(const core::TransferTask& task,
                                   int threads,
                                   std::stop_token stop_token) override {
        ++calls_;
        auto now_running = ++in_flight_;
        auto seen = max_in_flight_.load();
        while (now_running > seen && !max_in_flight_.compare_exchange_weak(seen, now_running)) {
        }
        last_threads_ = threads;
        auto result = behavior_(task, threads, stop_token);
        --in_flight_;
        return result;
    }

    std::optional<std::uint64_t> EstimateSize(const core::TransferTask&,
                                              std::stop_token) override {
        ++estimates_;
        return size_;
    }

    int calls() const { return calls_.load(); }
    int estimates() const { return estimates_.load(); }
    int max_in_flight() const { return max_in_flight_.load(); }
    int last_threads() const { return last_threads_.load(); }

private:
    Behavior behavior_;
    std::optional<std::uint64_t> size_;
    std::atomic<int> calls_{0};
    std::atomic<int> estimates_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::atomic<int> last_threads_{0};
};

// Writes `bytes` into the destination file unless it already exists,
// reporting the copied/skipped counts the way gsutil -n does.
inline FakeMechanism::Behavior CopyBytes(std::uint64_t bytes,
                                         std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    return [bytes, delay](const core::TransferTask& task, int, std::stop_token) {
        std::filesystem::path destination = task.destination_path;
        if (std::filesystem::exists(destination)) {
            return core::MechanismResult{.exit_code = 0,
                                         .output = "Skipping existing item: " + task.source_path,
                                         .items_copied = 0,
                                         .items_skipped = 1};
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        WriteBytes(destination, bytes);
        return core::MechanismResult{.exit_code = 0,
                                     .output = "Copying " + task.source_path + "...",
                                     .items_copied = 1,
                                     .items_skipped = 0};
    };
}

// Runs until the stop token fires, then reports a terminated process.
inline FakeMechanism::Behavior BlockUntilStopped() {
    return [](const core::TransferTask&, int, std::stop_token stop_token) {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, stop_token, [] { return false; });
        return core::MechanismResult{.exit_code = -1, .output = "", .terminated = true};
    };
}

inline FakeMechanism::Behavior FailWith(int exit_code, std::string output) {
    return [exit_code, output](const core::TransferTask&, int, std::stop_token) {
        return core::MechanismResult{.exit_code = exit_code, .output = output};
    };
}

} // namespace bucketpull::test
