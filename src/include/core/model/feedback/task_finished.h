#pragma once

#include <core/model/transfer_outcome.h>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace bucketpull::core::feedback {

struct TaskFinished {
    std::string batch_id;
    std::size_t index;
    TransferOutcome outcome;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TaskFinished, batch_id, index, outcome);
};

} // namespace bucketpull::core::feedback
