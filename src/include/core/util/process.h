#pragma once

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

namespace bucketpull::core {

struct ProcessResult {
    int exit_code{-1};
    std::string output;     // stdout and stderr, interleaved
    bool terminated{false}; // killed because a stop was requested
    bool launched{true};    // false when the executable could not be started
};

// Runs an external command in its own process group. A stop request
// terminates the whole group instead of waiting for it to finish.
class ProcessRunner {
public:
    explicit ProcessRunner(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    ProcessResult Run(const std::string& executable,
                      const std::vector<std::string>& args,
                      std::stop_token stop_token = {}) const;

private:
    std::chrono::milliseconds poll_interval_;
};

} // namespace bucketpull::core
