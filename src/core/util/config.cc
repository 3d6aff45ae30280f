#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <core/util/error.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace bucketpull::core {

namespace {

std::filesystem::path config_file = path::kConfigDir / "config.toml";

} // namespace

Settings DefaultSettings() {
    return Settings{
        .max_parallel = transfer::kDefaultMaxParallel,
        .threads_per_transfer = transfer::kDefaultThreadsPerTransfer,
        .poll_interval = transfer::kDefaultPollInterval,
        .render_interval = transfer::kDefaultRenderInterval,
        .sliced_download_threshold = std::string(transfer::kDefaultSlicedDownloadThreshold),
        .size_estimation = SizeEstimation::kFiles,
        .tool = std::string(transfer::kDefaultTool),
        .destination = path::kDefaultDestinationDir,
    };
}

Settings LoadSettings(const toml::table& table) {
    Settings loaded = DefaultSettings();

    if (const auto* transfer_table = table["transfer"].as_table()) {
        const auto& setting = *transfer_table;
        loaded.max_parallel = setting["max-parallel"].value_or(loaded.max_parallel);
        loaded.threads_per_transfer = setting["threads-per-transfer"].value_or(
            loaded.threads_per_transfer);
        loaded.poll_interval = std::chrono::milliseconds(
            setting["poll-interval-ms"].value_or(loaded.poll_interval.count()));
        loaded.render_interval = std::chrono::milliseconds(
            setting["render-interval-ms"].value_or(loaded.render_interval.count()));
        loaded.sliced_download_threshold = setting["sliced-download-threshold"].value_or(
            loaded.sliced_download_threshold);
        loaded.tool = setting["tool"].value_or(loaded.tool);

        if (setting.contains("size-estimation")) {
            std::string text = setting["size-estimation"].value_or(std::string{});
            if (auto mode = ParseSizeEstimation(text)) {
                loaded.size_estimation = *mode;
            } else {
                spdlog::warn("Unknown size-estimation \"{}\", using \"{}\"",
                             text,
                             SizeEstimationToString(loaded.size_estimation));
            }
        }
    }

    if (const auto* general_table = table["general"].as_table()) {
        const auto& setting = *general_table;
        if (setting.contains("destination")) {
            loaded.destination = setting["destination"].value_or(loaded.destination.string());
        }
    }

    return loaded;
}

void ValidateSettings(const Settings& value) {
    if (value.max_parallel < 1) {
        throw ConfigError("max-parallel must be at least 1, got "
                          + std::to_string(value.max_parallel));
    }
    if (value.threads_per_transfer < 1) {
        throw ConfigError("threads-per-transfer must be at least 1, got "
                          + std::to_string(value.threads_per_transfer));
    }
    if (value.poll_interval.count() <= 0) {
        throw ConfigError("poll-interval-ms must be positive");
    }
    if (value.render_interval.count() <= 0) {
        throw ConfigError("render-interval-ms must be positive");
    }
    if (value.tool.empty()) {
        throw ConfigError("tool must not be empty");
    }
}

void InitConfig(const std::optional<std::filesystem::path>& config_path) {
    if (config_path) {
        config_file = *config_path;
    }
    auto config_dir = config_file.parent_path();
    if (!config_dir.empty() && !std::filesystem::exists(config_dir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(config_dir);
    }
    if (!std::filesystem::exists(config_file)) {
        std::ofstream ofs(config_file);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(config_file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", config_file.string(), err.description());
        config = toml::table{};
    }

    settings = LoadSettings(config);
}

void SaveConfig() {
    std::ofstream ofs(config_file);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", config_file.string());
        return;
    }
    config.insert_or_assign(
        "transfer",
        toml::table{
            {"max-parallel", settings.max_parallel},
            {"threads-per-transfer", settings.threads_per_transfer},
            {"poll-interval-ms", static_cast<int64_t>(settings.poll_interval.count())},
            {"render-interval-ms", static_cast<int64_t>(settings.render_interval.count())},
            {"sliced-download-threshold", settings.sliced_download_threshold},
            {"size-estimation", std::string(SizeEstimationToString(settings.size_estimation))},
            {"tool", settings.tool},
        });
    config.insert_or_assign("general",
                            toml::table{
                                {"destination", settings.destination.string()},
                            });
    ofs << config;
    spdlog::info("Config saved to \"{}\"", config_file.string());
}

} // namespace bucketpull::core
