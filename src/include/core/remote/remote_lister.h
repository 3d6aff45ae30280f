#pragma once

#include <core/model/remote_entry.h>
#include <core/model/selection.h>
#include <string>
#include <string_view>

namespace bucketpull::core {

class RemoteLister {
public:
    virtual ~RemoteLister() = default;

    // Immediate children of `bucket_root + prefix`, relative to bucket_root.
    // Throws PlanningError when the location cannot be listed.
    virtual RemoteListing List(const std::string& bucket_root, const std::string& prefix) = 0;
};

// "my-bucket" -> "gs://my-bucket/"
std::string NormalizeBucket(std::string_view bucket);

// Lists the parent of every selected path and merges the results into one
// listing rooted at the bucket, so nested selections can be validated.
RemoteListing ListForSelection(RemoteLister& lister,
                               const std::string& bucket_root,
                               const Selection& selection);

} // namespace bucketpull::core
