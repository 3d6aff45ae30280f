#pragma once

#include <core/transfer/transfer_mechanism.h>
#include <core/util/process.h>
#include <optional>
#include <string>
#include <vector>

namespace bucketpull::core {

struct GsutilOptions {
    std::string tool = "gsutil";
    std::string sliced_download_threshold = "64M";
};

struct CopyCounts {
    std::size_t copied{0};
    std::size_t skipped{0};
};

// Runs `gsutil -m ... cp [-r] -n <source> <destination>` per task.
class GsutilMechanism : public TransferMechanism {
public:
    explicit GsutilMechanism(GsutilOptions options, ProcessRunner runner = ProcessRunner());

    MechanismResult Transfer(const TransferTask& task,
                             int threads,
                             std::stop_token stop_token) override;

    std::optional<std::uint64_t> EstimateSize(const TransferTask& task,
                                              std::stop_token stop_token) override;

    // First line of `gsutil version`, or nullopt when the tool cannot run.
    std::optional<std::string> ProbeTool() const;

    // Argument vector after the executable name.
    std::vector<std::string> BuildCopyArgs(const TransferTask& task, int threads) const;

    static CopyCounts ParseCopyOutput(const std::string& output);
    static std::optional<std::uint64_t> ParseDuOutput(const std::string& output);

private:
    GsutilOptions options_;
    ProcessRunner runner_;
};

} // namespace bucketpull::core
