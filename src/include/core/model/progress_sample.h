#pragma once

#include "transfer_task.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace bucketpull::core {

struct ProgressSample {
    TransferTask task;
    std::uint64_t observed_bytes{0};
    std::optional<std::uint64_t> estimated_total_bytes; // unset: render as indeterminate
    std::chrono::steady_clock::time_point timestamp;

    // Fraction in [0, 1], or nullopt when the total is unknown.
    std::optional<double> Fraction() const {
        if (!estimated_total_bytes) {
            return std::nullopt;
        }
        if (*estimated_total_bytes == 0) {
            return 1.0;
        }
        return std::min(1.0,
                        static_cast<double>(observed_bytes)
                            / static_cast<double>(*estimated_total_bytes));
    }
};

using ProgressSampleCallback = std::function<void(const ProgressSample&)>;

} // namespace bucketpull::core
