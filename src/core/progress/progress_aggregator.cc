#include <algorithm>
#include <core/constant/transfer.h>
#include <core/progress/progress_aggregator.h>
#include <spdlog/spdlog.h>

namespace bucketpull::core {

ProgressAggregator::ProgressAggregator(std::vector<std::optional<std::uint64_t>> estimates)
    : estimates_(std::move(estimates))
    , slots_(std::make_unique<Slot[]>(estimates_.size())) {
    for (const auto& estimate : estimates_) {
        if (estimate) {
            known_total_ += *estimate;
        } else {
            all_known_ = false;
        }
    }
}

void ProgressAggregator::raise(std::size_t index, std::uint64_t value) {
    auto& observed = slots_[index].observed;
    auto current = observed.load();
    while (value > current && !observed.compare_exchange_weak(current, value)) {
    }
}

void ProgressAggregator::Observe(std::size_t index, std::uint64_t observed_bytes) {
    if (index >= estimates_.size()) {
        spdlog::error("Progress for unknown task index {}", index);
        return;
    }
    raise(index, observed_bytes);
}

void ProgressAggregator::Complete(std::size_t index, std::optional<std::uint64_t> final_bytes) {
    if (index >= estimates_.size()) {
        spdlog::error("Completion for unknown task index {}", index);
        return;
    }
    if (final_bytes) {
        raise(index, *final_bytes);
    }
    if (!slots_[index].done.exchange(true)) {
        ++completed_;
    }
}

ProgressSnapshot ProgressAggregator::Snapshot() const {
    ProgressSnapshot snapshot;
    snapshot.total_tasks = estimates_.size();
    if (estimates_.empty()) {
        snapshot.total_bytes = 0;
        snapshot.fraction = 1.0;
        return snapshot;
    }

    double weighted = 0.0;
    std::size_t completed = 0;
    for (std::size_t i = 0; i < estimates_.size(); ++i) {
        bool done = slots_[i].done.load();
        auto observed = slots_[i].observed.load();
        const auto& estimate = estimates_[i];

        if (done) {
            ++completed;
            // a finished task is worth its full size even if the last sample was short
            snapshot.observed_bytes += std::max(observed, estimate.value_or(0));
        } else {
            snapshot.observed_bytes += observed;
        }

        if (all_known_ && known_total_ > 0 && *estimate > 0) {
            double part = done ? 1.0
                               : std::min(static_cast<double>(observed)
                                              / static_cast<double>(*estimate),
                                          transfer::kInterimFractionCap);
            weighted += part * static_cast<double>(*estimate);
        }
    }

    snapshot.completed_tasks = completed;
    if (all_known_) {
        snapshot.total_bytes = known_total_;
    }
    if (completed == estimates_.size()) {
        snapshot.fraction = 1.0;
    } else if (all_known_ && known_total_ > 0) {
        snapshot.fraction = std::min(weighted / static_cast<double>(known_total_),
                                     transfer::kInterimFractionCap);
    } else {
        snapshot.fraction = static_cast<double>(completed)
                            / static_cast<double>(estimates_.size());
    }
    return snapshot;
}

} // namespace bucketpull::core
