#pragma once

#include <core/model/transfer_task.h>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace bucketpull::core::feedback {

struct TaskStarted {
    std::string batch_id;
    std::size_t index;
    TransferTask task;
    std::uint64_t total_bytes;
    bool total_known;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TaskStarted, batch_id, index, task, total_bytes, total_known);
};

} // namespace bucketpull::core::feedback
