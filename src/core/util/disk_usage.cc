#include <core/util/disk_usage.h>

namespace fs = std::filesystem;

namespace bucketpull::core {

std::optional<std::uint64_t> MeasureDiskUsage(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            return 0;
        }
        return std::nullopt;
    }
    if (!fs::exists(status)) {
        return 0;
    }
    if (fs::is_regular_file(status)) {
        auto size = fs::file_size(path, ec);
        return ec ? std::optional<std::uint64_t>(0) : std::optional<std::uint64_t>(size);
    }
    if (!fs::is_directory(status)) {
        return 0;
    }

    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::nullopt;
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            // the transfer tool renames temporary files while we walk; a
            // short reading is corrected on the next sample
            break;
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += size;
            }
        }
    }
    return total;
}

} // namespace bucketpull::core
