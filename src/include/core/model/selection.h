#pragma once

#include <string>
#include <vector>

namespace bucketpull::core {

enum class SelectionMode {
    kSingleFile,
    kSingleFolder,
    kMultipleFiles,
    kMultipleFolders,
    kEverything,
};

// Paths are relative to the listing root (the bucket), e.g. "photos/2024/".
struct Selection {
    SelectionMode mode{SelectionMode::kEverything};
    std::vector<std::string> paths;
};

} // namespace bucketpull::core
