#include <core/constant/transfer.h>
#include <core/remote/remote_lister.h>
#include <core/util/error.h>
#include <spdlog/spdlog.h>
#include <unordered_set>
#include <vector>

namespace bucketpull::core {

namespace {

std::string parentPrefix(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.rfind('/');
    return slash == std::string::npos ? std::string{} : path.substr(0, slash + 1);
}

} // namespace

std::string NormalizeBucket(std::string_view bucket) {
    std::string normalized(bucket);
    while (!normalized.empty() && normalized.front() == ' ') {
        normalized.erase(normalized.begin());
    }
    while (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    if (!normalized.starts_with(transfer::kBucketScheme)) {
        normalized.insert(0, transfer::kBucketScheme);
    }
    if (normalized.size() == transfer::kBucketScheme.size()) {
        throw PlanningError("bucket name is empty");
    }
    if (!normalized.ends_with('/')) {
        normalized.push_back('/');
    }
    return normalized;
}

RemoteListing ListForSelection(RemoteLister& lister,
                               const std::string& bucket_root,
                               const Selection& selection) {
    if (selection.mode == SelectionMode::kEverything) {
        return lister.List(bucket_root, "");
    }

    std::vector<std::string> prefixes;
    std::unordered_set<std::string> seen_prefixes;
    for (const auto& path : selection.paths) {
        auto prefix = parentPrefix(path);
        if (seen_prefixes.insert(prefix).second) {
            prefixes.push_back(std::move(prefix));
        }
    }

    RemoteListing merged{.root = bucket_root, .entries = {}};
    std::unordered_set<std::string> seen_entries;
    for (const auto& prefix : prefixes) {
        auto listing = lister.List(bucket_root, prefix);
        for (auto& entry : listing.entries) {
            if (seen_entries.insert(entry.relative_path).second) {
                merged.entries.push_back(std::move(entry));
            }
        }
    }
    spdlog::debug("Merged {} listing(s) into {} entries", prefixes.size(), merged.entries.size());
    return merged;
}

} // namespace bucketpull::core
