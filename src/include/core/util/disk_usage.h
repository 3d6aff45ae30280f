#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace bucketpull::core {

// On-disk size of a file, or the recursive sum of regular files below a
// directory. A path that does not exist yet measures 0. Entries that vanish
// or cannot be read mid-walk are skipped. Returns nullopt only when the
// path itself cannot be inspected.
std::optional<std::uint64_t> MeasureDiskUsage(const std::filesystem::path& path);

} // namespace bucketpull::core
