#pragma once

#include <core/remote/remote_lister.h>
#include <core/util/process.h>
#include <string>

namespace bucketpull::core {

// `gsutil ls <bucket_root><prefix>`
class GsutilLister : public RemoteLister {
public:
    explicit GsutilLister(std::string tool = "gsutil", ProcessRunner runner = ProcessRunner());

    RemoteListing List(const std::string& bucket_root, const std::string& prefix) override;

    // Lines outside bucket_root (warnings, headers ending in ':') are dropped.
    // A trailing '/' marks a folder.
    static RemoteListing ParseListing(const std::string& bucket_root,
                                      const std::string& prefix,
                                      const std::string& output);

private:
    std::string tool_;
    ProcessRunner runner_;
};

} // namespace bucketpull::core
