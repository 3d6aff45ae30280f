#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace bucketpull::core {

// Which tasks get a remote size lookup before they start.
enum class SizeEstimation {
    kNone,
    kFiles, // folders are often too expensive to size remotely
    kAll,
};

NLOHMANN_JSON_SERIALIZE_ENUM(SizeEstimation,
                             {
                                 {SizeEstimation::kNone, "none"},
                                 {SizeEstimation::kFiles, "files"},
                                 {SizeEstimation::kAll, "all"},
                             });

std::optional<SizeEstimation> ParseSizeEstimation(std::string_view text);
std::string_view SizeEstimationToString(SizeEstimation mode);

} // namespace bucketpull::core
