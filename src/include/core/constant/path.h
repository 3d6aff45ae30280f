#pragma once

#include <cstdlib>
#include <filesystem>

namespace bucketpull::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::current_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "bucketpull"
                                             / "logs";

inline const std::filesystem::path kConfigDir = kHomeDir / ".config" / "bucketpull";

// ~/Desktop/Canva when it exists, otherwise the home directory.
inline const std::filesystem::path kDefaultDestinationDir = []() -> std::filesystem::path {
    auto canva_dir = kHomeDir / "Desktop" / "Canva";
    std::error_code ec;
    if (std::filesystem::is_directory(canva_dir, ec)) {
        return canva_dir;
    }
    return kHomeDir;
}();

} // namespace path
} // namespace bucketpull::core
