#pragma once

#include <core/remote/remote_lister.h>
#include <core/util/error.h>
#include <map>
#include <string>
#include <vector>

namespace bucketpull::test {

// Serves canned listings keyed by prefix ("" is the bucket root).
class FakeLister : public core::RemoteLister {
public:
    void Add(const std::string& prefix, std::vector<core::RemoteEntry> entries) {
        listings_[prefix] = std::move(entries);
    }

    core::RemoteListing List(const std::string& bucket_root, const std::string& prefix) override {
        listed_prefixes_.push_back(prefix);
        auto it = listings_.find(prefix);
        if (it == listings_.end()) {
            throw core::PlanningError("cannot list " + bucket_root + prefix
                                      + ": CommandException: One or more URLs matched no objects.");
        }
        return core::RemoteListing{.root = bucket_root, .entries = it->second};
    }

    const std::vector<std::string>& listed_prefixes() const { return listed_prefixes_; }

private:
    std::map<std::string, std::vector<core::RemoteEntry>> listings_;
    std::vector<std::string> listed_prefixes_;
};

inline core::RemoteEntry File(std::string path) {
    return core::RemoteEntry{.relative_path = std::move(path), .kind = core::TransferKind::kFile};
}

inline core::RemoteEntry Folder(std::string path) {
    return core::RemoteEntry{.relative_path = std::move(path), .kind = core::TransferKind::kFolder};
}

} // namespace bucketpull::test
