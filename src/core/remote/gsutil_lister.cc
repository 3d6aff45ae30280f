#include <core/remote/gsutil_lister.h>
#include <core/util/error.h>
#include <sstream>
#include <spdlog/spdlog.h>

namespace bucketpull::core {

GsutilLister::GsutilLister(std::string tool, ProcessRunner runner)
    : tool_(std::move(tool))
    , runner_(std::move(runner)) {}

RemoteListing GsutilLister::List(const std::string& bucket_root, const std::string& prefix) {
    auto location = bucket_root + prefix;
    spdlog::info("Listing {}", location);

    auto result = runner_.Run(tool_, {"ls", location});
    if (!result.launched) {
        throw PlanningError("cannot run " + tool_ + ": " + result.output);
    }
    if (result.exit_code != 0) {
        spdlog::error("{} ls {} exited with {}", tool_, location, result.exit_code);
        throw PlanningError("cannot list " + location + ": " + result.output);
    }

    auto listing = ParseListing(bucket_root, prefix, result.output);
    spdlog::debug("{} entries under {}", listing.entries.size(), location);
    return listing;
}

RemoteListing GsutilLister::ParseListing(const std::string& bucket_root,
                                         const std::string& prefix,
                                         const std::string& output) {
    RemoteListing listing{.root = bucket_root, .entries = {}};
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (line.empty() || line.back() == ':' || !line.starts_with(bucket_root)) {
            continue;
        }
        auto relative = line.substr(bucket_root.size());
        // a folder placeholder object lists as the prefix itself
        if (relative.empty() || relative == prefix) {
            continue;
        }
        auto kind = relative.back() == '/' ? TransferKind::kFolder : TransferKind::kFile;
        listing.entries.push_back(RemoteEntry{.relative_path = std::move(relative), .kind = kind});
    }
    return listing;
}

} // namespace bucketpull::core
