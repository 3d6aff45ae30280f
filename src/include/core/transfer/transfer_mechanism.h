#pragma once

#include <core/model/transfer_task.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

namespace bucketpull::core {

struct MechanismResult {
    int exit_code{0};
    std::string output;
    bool terminated{false};                   // stopped before it finished on its own
    std::optional<std::size_t> items_copied;  // nullopt when the mechanism cannot tell
    std::optional<std::size_t> items_skipped;
};

// External copy of one source tree to one destination tree. Implementations
// never overwrite an existing destination file and must return promptly
// once stop_token is signalled.
class TransferMechanism {
public:
    virtual ~TransferMechanism() = default;

    // Recursive when task.kind is kFolder; threads is an intra-file parallelism hint.
    virtual MechanismResult Transfer(const TransferTask& task,
                                     int threads,
                                     std::stop_token stop_token) = 0;

    // Remote size of the task's source, or nullopt when it cannot be determined.
    virtual std::optional<std::uint64_t> EstimateSize(const TransferTask& task,
                                                      std::stop_token stop_token) = 0;
};

} // namespace bucketpull::core
