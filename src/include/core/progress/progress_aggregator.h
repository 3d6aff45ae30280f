#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace bucketpull::core {

struct ProgressSnapshot {
    std::uint64_t observed_bytes{0};
    std::optional<std::uint64_t> total_bytes; // set only when every task's size is known
    std::size_t completed_tasks{0};
    std::size_t total_tasks{0};
    double fraction{0.0};

    bool IsComplete() const { return completed_tasks == total_tasks; }
};

// Batch-wide progress shared by the monitors (writers) and the render loop
// (reader). Per-task counters only grow, and a finished task counts as fully
// done, so successive snapshots never go backwards. The fraction reaches 1
// only once every task is finished.
class ProgressAggregator {
public:
    // One entry per task in plan order; nullopt means the size is unknown.
    explicit ProgressAggregator(std::vector<std::optional<std::uint64_t>> estimates);

    void Observe(std::size_t index, std::uint64_t observed_bytes);

    void Complete(std::size_t index, std::optional<std::uint64_t> final_bytes = std::nullopt);

    ProgressSnapshot Snapshot() const;

    std::size_t task_count() const { return estimates_.size(); }

private:
    struct Slot {
        std::atomic<std::uint64_t> observed{0};
        std::atomic<bool> done{false};
    };

    void raise(std::size_t index, std::uint64_t value);

    std::vector<std::optional<std::uint64_t>> estimates_;
    std::unique_ptr<Slot[]> slots_;
    std::atomic<std::size_t> completed_{0};
    bool all_known_{true};
    std::uint64_t known_total_{0};
};

} // namespace bucketpull::core
