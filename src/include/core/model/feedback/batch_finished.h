#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace bucketpull::core::feedback {

struct BatchFinished {
    std::string batch_id;
    std::size_t succeeded;
    std::size_t skipped;
    std::size_t failed;
    bool cancelled;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(BatchFinished, batch_id, succeeded, skipped, failed, cancelled);
};

} // namespace bucketpull::core::feedback
