#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace bucketpull::core {

enum class TransferKind {
    kFile,
    kFolder, // copied recursively by the transfer mechanism
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferKind,
                             {
                                 {TransferKind::kFile, "File"},
                                 {TransferKind::kFolder, "Folder"},
                             });

// Identity is the (source_path, destination_path) pair.
struct TransferTask {
    std::string source_path;      // remote, e.g. gs://bucket/dir/
    std::string destination_path; // local
    TransferKind kind{TransferKind::kFile};
    int thread_hint{1};

    bool operator==(const TransferTask& other) const {
        return source_path == other.source_path && destination_path == other.destination_path;
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferTask, source_path, destination_path, kind, thread_hint);
};

std::string_view TransferKindToString(TransferKind kind);

} // namespace bucketpull::core
