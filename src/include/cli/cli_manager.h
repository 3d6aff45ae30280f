#pragma once

#include "argument_parser.h"
#include "progress_display.h"
#include "terminal.h"
#include <core/model.h>
#include <core/remote/remote_lister.h>
#include <core/transfer/transfer_mechanism.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace bucketpull::cli {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitSomeFailed = 2;
constexpr int kExitCancelled = 130;

// Turns command-line options (or the interactive menu) into a batch, runs it
// and reports. Settings come from core::settings.
class CliManager {
public:
    CliManager(CliOptions options,
               core::RemoteLister& lister,
               core::TransferMechanism& mechanism,
               Terminal& terminal,
               std::stop_token stop_token = {});

    // Exit status for the process.
    int Run();

    // "1, 3,5" against `count` listed items -> {0, 2, 4}. Throws UsageError.
    static std::vector<std::size_t> ParseIndices(const std::string& text, std::size_t count);

    static int ExitStatusFor(const core::BatchReport& report);

private:
    std::optional<core::BatchPlan> planInteractive();
    core::BatchPlan planFromOptions();
    core::BatchPlan planFromReport(const std::string& report_path);

    std::filesystem::path prepareDestination(const std::string& destination);
    void printListing(const core::RemoteListing& listing);
    int runBatch(const core::BatchPlan& plan);
    void writeReport(const core::BatchReport& report, const std::string& report_path);

    CliOptions options_;
    core::RemoteLister& lister_;
    core::TransferMechanism& mechanism_;
    Terminal& terminal_;
    std::stop_token stop_token_;
    ProgressDisplay progress_display_;
};

} // namespace bucketpull::cli
