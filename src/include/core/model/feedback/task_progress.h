#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace bucketpull::core::feedback {

struct TaskProgress {
    std::string batch_id;
    std::size_t index;
    std::string source_path;
    std::uint64_t observed_bytes;
    std::uint64_t total_bytes;
    bool total_known; // false: show a spinner instead of a percentage

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        TaskProgress, batch_id, index, source_path, observed_bytes, total_bytes, total_known);
};

} // namespace bucketpull::core::feedback
