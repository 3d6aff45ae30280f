#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace bucketpull::core::feedback {

struct BatchStarted {
    std::string batch_id;
    std::size_t total_tasks;
    int max_parallel;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(BatchStarted, batch_id, total_tasks, max_parallel);
};

} // namespace bucketpull::core::feedback
