#include <cli/cli_manager.h>
#include <core/batch/scheduler.h>
#include <core/constant/path.h>
#include <core/planner/task_planner.h>
#include <core/util/config.h>
#include <core/util/error.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace fs = std::filesystem;

using json = nlohmann::json;

namespace bucketpull::cli {

using namespace bucketpull::core;

CliManager::CliManager(CliOptions options,
                       RemoteLister& lister,
                       TransferMechanism& mechanism,
                       Terminal& terminal,
                       std::stop_token stop_token)
    : options_(std::move(options))
    , lister_(lister)
    , mechanism_(mechanism)
    , terminal_(terminal)
    , stop_token_(std::move(stop_token))
    , progress_display_(terminal.out()) {}

int CliManager::Run() {
    try {
        if (options_.retry_path) {
            return runBatch(planFromReport(*options_.retry_path));
        }
        if (options_.interactive) {
            auto plan = planInteractive();
            if (!plan) {
                return stop_token_.stop_requested() ? kExitCancelled : kExitFatal;
            }
            return runBatch(*plan);
        }
        return runBatch(planFromOptions());
    } catch (const PlanningError& e) {
        spdlog::error("Planning failed: {}", e.what());
        terminal_.PrintError(e.what());
        return kExitFatal;
    } catch (const UsageError& e) {
        terminal_.PrintError(e.what());
        return kExitFatal;
    }
}

std::vector<std::size_t> CliManager::ParseIndices(const std::string& text, std::size_t count) {
    std::vector<std::size_t> indices;
    std::istringstream stream(text);
    std::string token;
    while (std::getline(stream, token, ',')) {
        auto first = token.find_first_not_of(" \t");
        auto last = token.find_last_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        token = token.substr(first, last - first + 1);

        std::size_t consumed = 0;
        unsigned long number = 0;
        try {
            number = std::stoul(token, &consumed);
        } catch (const std::exception&) {
            throw UsageError("Invalid input \"" + token + "\". Please enter numbers.");
        }
        if (consumed != token.size() || token.front() == '-') {
            throw UsageError("Invalid input \"" + token + "\". Please enter numbers.");
        }
        if (number < 1 || number > count) {
            throw UsageError("No item numbered " + token);
        }
        indices.push_back(static_cast<std::size_t>(number - 1));
    }
    if (indices.empty()) {
        throw UsageError("No items selected.");
    }
    return indices;
}

int CliManager::ExitStatusFor(const BatchReport& report) {
    if (report.WasCancelled()) {
        return kExitCancelled;
    }
    return report.CountFailed() > 0 ? kExitSomeFailed : kExitOk;
}

fs::path CliManager::prepareDestination(const std::string& destination) {
    fs::path root = destination;
    if (destination == "~" || destination.starts_with("~/")) {
        root = path::kHomeDir / destination.substr(std::min<std::size_t>(2, destination.size()));
    }
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        if (!fs::create_directories(root, ec) && ec) {
            throw PlanningError("Error creating directory " + root.string() + ": " + ec.message());
        }
        terminal_.PrintInfo("Created directory: " + root.string());
    } else if (!fs::is_directory(root, ec)) {
        throw PlanningError(root.string() + " is not a directory");
    }
    return root;
}

void CliManager::printListing(const RemoteListing& listing) {
    terminal_.Print("\nBucket contents:");
    for (std::size_t i = 0; i < listing.entries.size(); ++i) {
        terminal_.Print(std::to_string(i + 1) + ". " + listing.entries[i].relative_path);
    }
}

std::optional<BatchPlan> CliManager::planInteractive() {
    auto bucket_input = terminal_.Ask("Enter the GCS bucket name (e.g., gs://your-bucket): ");
    if (!bucket_input || stop_token_.stop_requested()) {
        return std::nullopt;
    }
    auto bucket = NormalizeBucket(*bucket_input);

    terminal_.Print("Listing contents of " + bucket + "...");
    auto listing = lister_.List(bucket, "");
    if (listing.entries.empty()) {
        terminal_.PrintError("No items found in the bucket or bucket does not exist.");
        return std::nullopt;
    }
    printListing(listing);

    terminal_.Print("\nWhat would you like to download?");
    terminal_.Print("1. Single file");
    terminal_.Print("2. Multiple files");
    terminal_.Print("3. Single folder");
    terminal_.Print("4. Multiple folders");
    terminal_.Print("5. Everything in this bucket");
    auto choice = terminal_.Ask("Enter your choice (1-5): ");
    if (!choice || stop_token_.stop_requested()) {
        return std::nullopt;
    }

    Selection selection;
    const char* index_prompt = nullptr;
    if (*choice == "1") {
        selection.mode = SelectionMode::kSingleFile;
        index_prompt = "Enter the number of the file to download: ";
    } else if (*choice == "2") {
        selection.mode = SelectionMode::kMultipleFiles;
        index_prompt = "Enter the numbers of files to download (comma-separated): ";
    } else if (*choice == "3") {
        selection.mode = SelectionMode::kSingleFolder;
        index_prompt = "Enter the number of the folder to download: ";
    } else if (*choice == "4") {
        selection.mode = SelectionMode::kMultipleFolders;
        index_prompt = "Enter the numbers of folders to download (comma-separated): ";
    } else if (*choice == "5") {
        selection.mode = SelectionMode::kEverything;
    } else {
        terminal_.PrintError("Invalid choice. Please run the program again and select a valid option.");
        return std::nullopt;
    }

    auto default_destination = options_.destination.value_or(settings.destination.string());
    auto destination_input = terminal_.Ask("Enter destination directory [default: "
                                           + default_destination + "]: ");
    if (!destination_input || stop_token_.stop_requested()) {
        return std::nullopt;
    }
    auto destination = prepareDestination(destination_input->empty() ? default_destination
                                                                     : *destination_input);

    if (index_prompt) {
        auto indices_input = terminal_.Ask(index_prompt);
        if (!indices_input || stop_token_.stop_requested()) {
            return std::nullopt;
        }
        for (auto index : ParseIndices(*indices_input, listing.entries.size())) {
            selection.paths.push_back(listing.entries[index].relative_path);
        }
    } else {
        terminal_.Print("Downloading everything from " + bucket + " to " + destination.string());
    }

    TaskPlanner planner(destination, settings.threads_per_transfer);
    return planner.Plan(selection, listing);
}

BatchPlan CliManager::planFromOptions() {
    auto bucket = NormalizeBucket(*options_.bucket);
    auto selection = ToSelection(options_);
    auto destination = prepareDestination(
        options_.destination.value_or(settings.destination.string()));

    auto listing = ListForSelection(lister_, bucket, selection);
    TaskPlanner planner(destination, settings.threads_per_transfer);
    return planner.Plan(selection, listing);
}

BatchPlan CliManager::planFromReport(const std::string& report_path) {
    std::ifstream ifs(report_path);
    if (!ifs.is_open()) {
        throw PlanningError("cannot open report " + report_path);
    }
    BatchReport report;
    try {
        report = json::parse(ifs).get<BatchReport>();
    } catch (const json::exception& e) {
        throw PlanningError("cannot read report " + report_path + ": " + e.what());
    }
    auto plan = report.RetryPlan();
    spdlog::info("Retrying {} failed task(s) from batch {}", plan.size(), report.batch_id());
    return plan;
}

int CliManager::runBatch(const BatchPlan& plan) {
    if (plan.empty()) {
        terminal_.PrintInfo("Nothing to download.");
    }

    SchedulerOptions scheduler_options{
        .max_parallel = settings.max_parallel,
        .poll_interval = settings.poll_interval,
        .render_interval = settings.render_interval,
        .size_estimation = settings.size_estimation,
    };
    Scheduler scheduler(mechanism_, scheduler_options, [this](Feedback&& feedback) {
        progress_display_.Update(feedback);
    });

    auto report = scheduler.Run(plan, stop_token_);
    progress_display_.ClearProgress();

    if (report.CountFailed() == 0) {
        terminal_.PrintInfo(report.Summary());
    } else {
        terminal_.PrintWarning(report.Summary());
    }
    if (options_.report_path) {
        writeReport(report, *options_.report_path);
    } else if (report.CountFailed() > 0) {
        terminal_.Print("Re-run the failed transfers with --report <file> and then --retry <file>.");
    }
    return ExitStatusFor(report);
}

void CliManager::writeReport(const BatchReport& report, const std::string& report_path) {
    std::ofstream ofs(report_path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for the batch report", report_path);
        terminal_.PrintError("Could not write report to " + report_path);
        return;
    }
    ofs << json(report).dump(2) << std::endl;
    terminal_.PrintInfo("Report written to " + report_path);
}

} // namespace bucketpull::cli
