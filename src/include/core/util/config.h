/*
    config.h
    Application configuration backed by a TOML file
    (~/.config/bucketpull/config.toml unless --config points elsewhere).

    Example file:

        [transfer]
        max-parallel = 16
        threads-per-transfer = 8
        poll-interval-ms = 100
        render-interval-ms = 250
        sliced-download-threshold = "64M"
        size-estimation = "files"   # none | files | all
        tool = "gsutil"

        [general]
        destination = "/home/me/Desktop/Canva"

    Reading a setting:
        int parallel = bucketpull::core::settings.max_parallel;
    Overriding from the command line, then validating:
        bucketpull::core::settings.max_parallel = 4;
        bucketpull::core::ValidateSettings(bucketpull::core::settings);

    Initialization and saving:
        bucketpull::core::InitConfig();   // loads the file or creates an empty one
        bucketpull::core::SaveConfig();   // writes the effective settings back
*/

#pragma once

#include <chrono>
#include <core/model/size_estimation.h>
#include <filesystem>
#include <optional>
#include <string>
#include <toml++/toml.h>

namespace bucketpull::core {

inline toml::table config;

struct Settings {
    int max_parallel;                         // concurrent transfers
    int threads_per_transfer;                 // intra-file parallelism hint
    std::chrono::milliseconds poll_interval;  // progress monitor sampling period
    std::chrono::milliseconds render_interval;
    std::string sliced_download_threshold;
    SizeEstimation size_estimation;
    std::string tool;                         // transfer tool executable
    std::filesystem::path destination;        // default destination root
};

inline Settings settings;

Settings DefaultSettings();

// Reads [transfer] and [general]; missing keys keep their defaults.
Settings LoadSettings(const toml::table& table);

// Throws ConfigError for out-of-range values.
void ValidateSettings(const Settings& value);

void InitConfig(const std::optional<std::filesystem::path>& config_path = std::nullopt);

void SaveConfig();

} // namespace bucketpull::core
