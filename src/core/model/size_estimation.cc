#include <algorithm>
#include <cctype>
#include <core/model/size_estimation.h>
#include <string>

namespace bucketpull::core {

std::optional<SizeEstimation> ParseSizeEstimation(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
    if (lowered == "none") {
        return SizeEstimation::kNone;
    }
    if (lowered == "files") {
        return SizeEstimation::kFiles;
    }
    if (lowered == "all") {
        return SizeEstimation::kAll;
    }
    return std::nullopt;
}

std::string_view SizeEstimationToString(SizeEstimation mode) {
    switch (mode) {
    case SizeEstimation::kNone:
        return "none";
    case SizeEstimation::kFiles:
        return "files";
    case SizeEstimation::kAll:
        return "all";
    }
    return "files";
}

} // namespace bucketpull::core
