#pragma once

#include <chrono>
#include <core/model/feedback.h>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

namespace bucketpull::cli {

// Renders feedback events: one line per started/finished task and a single
// overall bar that is rewritten in place, followed by the latest sample of each
// running task ("#3 42%", or "#3 [/] 1.20 MB" while its total is unknown).
// Safe to call from any thread.
class ProgressDisplay {
public:
    explicit ProgressDisplay(std::ostream& out = std::cout, int bar_width = 40);

    void Update(const core::Feedback& feedback);
    void ClearProgress();

    // 1536 -> "1.50 KB"
    static std::string FormatBytes(std::uint64_t bytes);
    // "[=====>    ]"
    static std::string RenderBar(double fraction, int width);

private:
    using Clock = std::chrono::steady_clock;

    void onBatchStarted(const core::feedback::BatchStarted& started);
    void onTaskStarted(const core::feedback::TaskStarted& started);
    void onTaskProgress(const core::feedback::TaskProgress& progress);
    void onTaskFinished(const core::feedback::TaskFinished& finished);
    void onBatchProgress(const core::feedback::BatchProgress& progress);
    void onBatchFinished(const core::feedback::BatchFinished& finished);

    void printLine(const std::string& line);
    void printProgress();
    std::string renderActiveTasks(char spinner) const;

    std::mutex mutex_;
    std::ostream& out_;
    int bar_width_;
    Clock::time_point started_at_;
    std::size_t total_tasks_{0};
    std::size_t spinner_frame_{0};
    bool bar_visible_{false};
    bool has_progress_{false};
    core::feedback::BatchProgress last_progress_{};
    std::map<std::size_t, core::feedback::TaskProgress> active_tasks_;
};

} // namespace bucketpull::cli
