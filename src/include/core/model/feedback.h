#pragma once

#include "feedback/batch_finished.h"
#include "feedback/batch_progress.h"
#include "feedback/batch_started.h"
#include "feedback/feedback_type.h"
#include "feedback/task_finished.h"
#include "feedback/task_progress.h"
#include "feedback/task_started.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace bucketpull::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

// May be invoked concurrently from worker, monitor and render threads.
using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace bucketpull::core
