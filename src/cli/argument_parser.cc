#include <algorithm>
#include <cctype>
#include <cli/argument_parser.h>
#include <core/constant/transfer.h>

namespace bucketpull::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i_(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    if (argc_ <= 1) {
        // 没有参数时进入交互模式
        options.interactive = true;
        return options;
    }

    while (i_ < argc_) {
        std::string arg = argv_[i_];
        if (arg.empty() || arg[0] != '-') {
            throw UsageError("Unexpected argument: " + arg);
        }
        parseOption(arg, options);
        i_++;
    }

    if (!options.show_help) {
        validateOptions(options);
    }
    return options;
}

std::string ArgumentParser::nextValue(const std::string& flag) {
    if (++i_ >= argc_) {
        throw UsageError("Missing value for " + flag);
    }
    return argv_[i_];
}

int ArgumentParser::nextInt(const std::string& flag) {
    auto value = nextValue(flag);
    std::size_t consumed = 0;
    int number = 0;
    try {
        number = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects a number, got \"" + value + "\"");
    }
    if (consumed != value.size()) {
        throw UsageError(flag + " expects a number, got \"" + value + "\"");
    }
    return number;
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "-b" || arg == "--bucket") {
        options.bucket = nextValue(arg);
    } else if (arg == "-d" || arg == "--destination") {
        options.destination = nextValue(arg);
    } else if (arg == "-f" || arg == "--file") {
        options.files.push_back(nextValue(arg));
    } else if (arg == "-F" || arg == "--folder") {
        options.folders.push_back(nextValue(arg));
    } else if (arg == "-a" || arg == "--everything") {
        options.everything = true;
    } else if (arg == "-i" || arg == "--interactive") {
        options.interactive = true;
    } else if (arg == "-p" || arg == "--max-parallel") {
        options.max_parallel = nextInt(arg);
    } else if (arg == "-t" || arg == "--threads") {
        options.threads = nextInt(arg);
    } else if (arg == "--poll-interval-ms") {
        options.poll_interval_ms = nextInt(arg);
    } else if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue(arg);
    } else if (arg == "-l" || arg == "--log-level") {
        std::string level = nextValue(arg);
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        options.log_level = std::move(level);
    } else if (arg == "--report") {
        options.report_path = nextValue(arg);
    } else if (arg == "--retry") {
        options.retry_path = nextValue(arg);
    } else if (arg == "--save-config") {
        options.save_config = true;
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw UsageError("Unknown option: " + arg);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) const {
    bool has_paths = !options.files.empty() || !options.folders.empty();
    if (!options.files.empty() && !options.folders.empty()) {
        throw UsageError("--file and --folder cannot be mixed in one batch");
    }
    if (options.everything && has_paths) {
        throw UsageError("--everything cannot be combined with --file or --folder");
    }
    if (options.interactive && (has_paths || options.everything || options.retry_path)) {
        throw UsageError("--interactive takes its selection from the prompt");
    }
    if (options.retry_path && (has_paths || options.everything || options.bucket)) {
        throw UsageError("--retry replays a report and takes no bucket or selection");
    }
    if (!options.interactive && !options.retry_path && !options.bucket) {
        throw UsageError("--bucket is required unless using --interactive or --retry");
    }

    if (options.log_level) {
        const auto& level = *options.log_level;
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw UsageError("Invalid log level: " + level);
        }
    }
}

void ArgumentParser::ShowHelp(std::ostream& out) {
    out << "Usage: bucketpull [options]\n\n"
        << "Downloads files and folders from a GCS bucket in parallel.\n"
        << "Without options an interactive menu is shown.\n\n"
        << "Options:\n"
        << "  -b, --bucket NAME          Bucket to download from (gs:// is optional)\n"
        << "  -d, --destination DIR      Destination directory\n"
        << "  -f, --file PATH            File to download (repeatable)\n"
        << "  -F, --folder PATH          Folder to download (repeatable)\n"
        << "  -a, --everything           Download every top-level entry (default)\n"
        << "  -i, --interactive          Choose what to download from a menu\n"
        << "  -p, --max-parallel N       Concurrent transfers (default: "
        << core::transfer::kDefaultMaxParallel << ")\n"
        << "  -t, --threads N            Threads per transfer (default: "
        << core::transfer::kDefaultThreadsPerTransfer << ")\n"
        << "      --poll-interval-ms N   Progress sampling period\n"
        << "  -c, --config PATH          Config file path\n"
        << "  -l, --log-level LVL        Log level (debug|info|warning|error)\n"
        << "      --report FILE          Write the batch report as JSON\n"
        << "      --retry FILE           Re-run the failed tasks of a saved report\n"
        << "      --save-config          Store the effective settings in the config file\n"
        << "  -h, --help                 Show this help message\n";
}

core::Selection ToSelection(const CliOptions& options) {
    using core::SelectionMode;
    if (!options.files.empty()) {
        return core::Selection{
            .mode = options.files.size() == 1 ? SelectionMode::kSingleFile
                                              : SelectionMode::kMultipleFiles,
            .paths = options.files,
        };
    }
    if (!options.folders.empty()) {
        return core::Selection{
            .mode = options.folders.size() == 1 ? SelectionMode::kSingleFolder
                                                : SelectionMode::kMultipleFolders,
            .paths = options.folders,
        };
    }
    return core::Selection{.mode = SelectionMode::kEverything, .paths = {}};
}

} // namespace bucketpull::cli
