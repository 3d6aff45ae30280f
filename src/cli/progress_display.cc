#include <algorithm>
#include <array>
#include <cli/progress_display.h>
#include <iomanip>
#include <sstream>

namespace bucketpull::cli {

namespace {

constexpr std::array<char, 4> kSpinnerFrames = {'|', '/', '-', '\\'};
// keeps the rewritten line within a typical terminal width
constexpr std::size_t kMaxActiveShown = 4;

} // namespace

ProgressDisplay::ProgressDisplay(std::ostream& out, int bar_width)
    : out_(out)
    , bar_width_(std::max(bar_width, 10))
    , started_at_(Clock::now()) {}

std::string ProgressDisplay::FormatBytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    auto size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    }
    return oss.str();
}

std::string ProgressDisplay::RenderBar(double fraction, int width) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    bool full = fraction >= 1.0;
    int position = static_cast<int>(width * fraction);
    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        bar += i < position ? '=' : (i == position && !full ? '>' : ' ');
    }
    bar += "]";
    return bar;
}

void ProgressDisplay::Update(const core::Feedback& feedback) {
    using core::FeedbackType;
    std::lock_guard lock(mutex_);
    switch (feedback.type) {
    case FeedbackType::kBatchStarted:
        onBatchStarted(feedback.data.get<core::feedback::BatchStarted>());
        break;
    case FeedbackType::kTaskStarted:
        onTaskStarted(feedback.data.get<core::feedback::TaskStarted>());
        break;
    case FeedbackType::kTaskFinished:
        onTaskFinished(feedback.data.get<core::feedback::TaskFinished>());
        break;
    case FeedbackType::kBatchProgress:
        onBatchProgress(feedback.data.get<core::feedback::BatchProgress>());
        break;
    case FeedbackType::kBatchFinished:
        onBatchFinished(feedback.data.get<core::feedback::BatchFinished>());
        break;
    case FeedbackType::kTaskProgress:
        onTaskProgress(feedback.data.get<core::feedback::TaskProgress>());
        break;
    }
}

void ProgressDisplay::ClearProgress() {
    std::lock_guard lock(mutex_);
    if (bar_visible_) {
        out_ << "\r\033[K" << std::flush;
        bar_visible_ = false;
    }
}

void ProgressDisplay::onBatchStarted(const core::feedback::BatchStarted& started) {
    started_at_ = Clock::now();
    total_tasks_ = started.total_tasks;
    has_progress_ = false;
    active_tasks_.clear();
    std::ostringstream oss;
    oss << "Starting download of " << started.total_tasks << " item(s), up to "
        << started.max_parallel << " at a time";
    printLine(oss.str());
}

void ProgressDisplay::onTaskStarted(const core::feedback::TaskStarted& started) {
    std::ostringstream oss;
    oss << "[" << started.index + 1 << "/" << total_tasks_ << "] Downloading "
        << started.task.source_path;
    if (started.total_known) {
        oss << " (" << FormatBytes(started.total_bytes) << ")";
    }
    printLine(oss.str());
}

void ProgressDisplay::onTaskProgress(const core::feedback::TaskProgress& progress) {
    active_tasks_[progress.index] = progress;
    if (has_progress_) {
        printProgress();
    }
}

void ProgressDisplay::onTaskFinished(const core::feedback::TaskFinished& finished) {
    active_tasks_.erase(finished.index);
    const auto& outcome = finished.outcome;
    std::ostringstream oss;
    switch (outcome.status) {
    case core::TransferStatus::kSuccess:
        oss << "Done     " << outcome.task.source_path;
        if (outcome.bytes_transferred) {
            oss << " (" << FormatBytes(*outcome.bytes_transferred) << ")";
        }
        break;
    case core::TransferStatus::kSkipped:
        oss << "Skipped  " << outcome.task.source_path << " (already present)";
        break;
    case core::TransferStatus::kFailed:
        oss << "Failed   " << outcome.task.source_path << " ["
            << core::ErrorKindToString(outcome.error_kind) << "]";
        if (outcome.error_detail && !outcome.error_detail->empty()) {
            oss << ": " << *outcome.error_detail;
        }
        break;
    }
    printLine(oss.str());
}

void ProgressDisplay::onBatchProgress(const core::feedback::BatchProgress& progress) {
    last_progress_ = progress;
    has_progress_ = true;
    printProgress();
}

void ProgressDisplay::onBatchFinished(const core::feedback::BatchFinished& finished) {
    if (has_progress_) {
        printProgress();
    }
    if (bar_visible_) {
        out_ << "\n";
        bar_visible_ = false;
    }
    if (finished.cancelled) {
        out_ << "Batch cancelled\n";
    }
    out_ << std::flush;
}

void ProgressDisplay::printLine(const std::string& line) {
    if (bar_visible_) {
        out_ << "\r\033[K";
    }
    out_ << line << "\n";
    bar_visible_ = false;
    if (has_progress_) {
        printProgress();
    } else {
        out_ << std::flush;
    }
}

void ProgressDisplay::printProgress() {
    const auto& progress = last_progress_;
    auto elapsed = std::chrono::duration<double>(Clock::now() - started_at_).count();
    auto speed = elapsed > 0.0 ? static_cast<double>(progress.observed_bytes) / elapsed : 0.0;

    char spinner = kSpinnerFrames[spinner_frame_++ % kSpinnerFrames.size()];

    std::ostringstream oss;
    oss << "\r";
    if (progress.total_known) {
        oss << RenderBar(progress.fraction, bar_width_) << " " << std::fixed
            << std::setprecision(0) << progress.fraction * 100.0 << "% "
            << FormatBytes(progress.observed_bytes) << "/" << FormatBytes(progress.total_bytes);
    } else {
        oss << "[" << spinner << "] " << FormatBytes(progress.observed_bytes);
    }
    oss << " " << FormatBytes(static_cast<std::uint64_t>(speed)) << "/s ("
        << progress.completed_tasks << "/" << progress.total_tasks << ")"
        << renderActiveTasks(spinner) << "\033[K";
    out_ << oss.str() << std::flush;
    bar_visible_ = true;
}

std::string ProgressDisplay::renderActiveTasks(char spinner) const {
    std::ostringstream oss;
    std::size_t shown = 0;
    for (const auto& [index, task] : active_tasks_) {
        if (shown == kMaxActiveShown) {
            oss << " +" << active_tasks_.size() - shown << " more";
            break;
        }
        oss << (shown == 0 ? " | " : "  ") << "#" << index + 1 << " ";
        if (task.total_known && task.total_bytes > 0) {
            auto fraction = std::min(
                static_cast<double>(task.observed_bytes) / static_cast<double>(task.total_bytes),
                1.0);
            oss << std::fixed << std::setprecision(0) << fraction * 100.0 << "%";
        } else {
            oss << "[" << spinner << "] " << FormatBytes(task.observed_bytes);
        }
        ++shown;
    }
    return oss.str();
}

} // namespace bucketpull::cli
