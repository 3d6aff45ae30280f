#include <algorithm>
#include <charconv>
#include <core/transfer/gsutil_mechanism.h>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <sstream>

namespace fs = std::filesystem;

namespace bucketpull::core {

namespace {

std::string withoutTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

GsutilMechanism::GsutilMechanism(GsutilOptions options, ProcessRunner runner)
    : options_(std::move(options))
    , runner_(std::move(runner)) {}

std::vector<std::string> GsutilMechanism::BuildCopyArgs(const TransferTask& task,
                                                        int threads) const {
    threads = std::max(threads, 1);
    std::vector<std::string> args{
        "-m",
        "-o",
        "GSUtil:parallel_thread_count=" + std::to_string(threads),
        "-o",
        "GSUtil:parallel_process_count=1",
        "-o",
        "GSUtil:sliced_object_download_threshold=" + options_.sliced_download_threshold,
        "-o",
        "GSUtil:sliced_object_download_max_components=" + std::to_string(threads),
        "cp",
    };
    if (task.kind == TransferKind::kFolder) {
        args.emplace_back("-r");
    }
    args.emplace_back("-n");

    if (task.kind == TransferKind::kFolder) {
        // gsutil copies a folder *into* an existing directory, so point it at
        // the parent; the planner keeps the folder name as the last component.
        args.emplace_back(withoutTrailingSlash(task.source_path));
        auto parent = fs::path(withoutTrailingSlash(task.destination_path)).parent_path();
        args.emplace_back(parent.empty() ? std::string("./") : parent.string() + "/");
    } else {
        args.emplace_back(task.source_path);
        args.emplace_back(task.destination_path);
    }
    return args;
}

MechanismResult GsutilMechanism::Transfer(const TransferTask& task,
                                          int threads,
                                          std::stop_token stop_token) {
    auto parent = fs::path(withoutTrailingSlash(task.destination_path)).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", parent.string(), ec.message());
            return MechanismResult{
                .exit_code = 1,
                .output = "Cannot create destination directory " + parent.string() + ": "
                          + ec.message(),
            };
        }
    }

    auto args = BuildCopyArgs(task, threads);
    std::string command_line = options_.tool;
    for (const auto& arg : args) {
        command_line += ' ';
        command_line += arg;
    }
    spdlog::debug("Running: {}", command_line);

    auto process = runner_.Run(options_.tool, args, stop_token);
    MechanismResult result{
        .exit_code = process.exit_code,
        .output = std::move(process.output),
        .terminated = process.terminated,
    };
    if (process.launched && !process.terminated) {
        auto counts = ParseCopyOutput(result.output);
        result.items_copied = counts.copied;
        result.items_skipped = counts.skipped;
    }
    return result;
}

std::optional<std::uint64_t> GsutilMechanism::EstimateSize(const TransferTask& task,
                                                           std::stop_token stop_token) {
    auto process = runner_.Run(options_.tool,
                               {"-q", "du", "-s", withoutTrailingSlash(task.source_path)},
                               stop_token);
    if (process.terminated || process.exit_code != 0) {
        spdlog::debug("Size lookup failed for {} (exit {})", task.source_path, process.exit_code);
        return std::nullopt;
    }
    return ParseDuOutput(process.output);
}

std::optional<std::string> GsutilMechanism::ProbeTool() const {
    auto process = runner_.Run(options_.tool, {"version"});
    if (!process.launched || process.exit_code != 0) {
        return std::nullopt;
    }
    std::istringstream iss(process.output);
    std::string line;
    std::getline(iss, line);
    return line;
}

CopyCounts GsutilMechanism::ParseCopyOutput(const std::string& output) {
    CopyCounts counts;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.rfind("Copying ", 0) == 0) {
            ++counts.copied;
        } else if (line.find("Skipping existing") != std::string::npos) {
            ++counts.skipped;
        }
    }
    return counts;
}

std::optional<std::uint64_t> GsutilMechanism::ParseDuOutput(const std::string& output) {
    std::istringstream iss(output);
    std::string token;
    if (!(iss >> token)) {
        return std::nullopt;
    }
    std::uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), size);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return size;
}

} // namespace bucketpull::core
