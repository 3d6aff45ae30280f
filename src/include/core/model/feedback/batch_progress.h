#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace bucketpull::core::feedback {

struct BatchProgress {
    std::string batch_id;
    std::uint64_t observed_bytes;
    std::uint64_t total_bytes;
    bool total_known;
    std::size_t completed_tasks;
    std::size_t total_tasks;
    double fraction; // byte-weighted when every total is known, task-count otherwise

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(BatchProgress,
                                   batch_id,
                                   observed_bytes,
                                   total_bytes,
                                   total_known,
                                   completed_tasks,
                                   total_tasks,
                                   fraction);
};

} // namespace bucketpull::core::feedback
