#pragma once

#include "transfer_task.h"
#include <string>
#include <string_view>
#include <vector>

namespace bucketpull::core {

struct RemoteEntry {
    std::string relative_path; // folders keep their trailing '/'
    TransferKind kind{TransferKind::kFile};
};

// Immediate entries below `root` (e.g. gs://bucket/).
struct RemoteListing {
    std::string root;
    std::vector<RemoteEntry> entries;

    const RemoteEntry* Find(std::string_view relative_path) const {
        for (const auto& entry : entries) {
            if (entry.relative_path == relative_path) {
                return &entry;
            }
        }
        return nullptr;
    }
};

} // namespace bucketpull::core
