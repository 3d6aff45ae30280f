#include <algorithm>
#include <array>
#include <cctype>
#include <core/transfer/error_classifier.h>
#include <string>

namespace bucketpull::core {

namespace {

constexpr std::array kErrorPatterns{
    // destination side
    ErrorPattern{ErrorKind::kDestinationUnwritable, "cannot create destination directory"},
    ErrorPattern{ErrorKind::kDestinationUnwritable, "no space left on device"},
    ErrorPattern{ErrorKind::kDestinationUnwritable, "read-only file system"},
    ErrorPattern{ErrorKind::kDestinationUnwritable, "[errno 13]"},
    ErrorPattern{ErrorKind::kDestinationUnwritable, "[errno 28]"},
    ErrorPattern{ErrorKind::kDestinationUnwritable, "[errno 30]"},
    ErrorPattern{ErrorKind::kDestinationUnwritable, "disk quota exceeded"},
    // remote object or bucket missing
    ErrorPattern{ErrorKind::kBucketOrPathNotFound, "no urls matched"},
    ErrorPattern{ErrorKind::kBucketOrPathNotFound, "bucketnotfoundexception"},
    ErrorPattern{ErrorKind::kBucketOrPathNotFound, "notfoundexception"},
    ErrorPattern{ErrorKind::kBucketOrPathNotFound, "404 not found"},
    ErrorPattern{ErrorKind::kBucketOrPathNotFound, "bucket does not exist"},
    ErrorPattern{ErrorKind::kBucketOrPathNotFound, "matched no objects"},
    // remote authorization
    ErrorPattern{ErrorKind::kPermissionDenied, "accessdeniedexception"},
    ErrorPattern{ErrorKind::kPermissionDenied, "403 forbidden"},
    ErrorPattern{ErrorKind::kPermissionDenied, "401 unauthorized"},
    ErrorPattern{ErrorKind::kPermissionDenied, "does not have storage."},
    ErrorPattern{ErrorKind::kPermissionDenied, "anonymous caller"},
    ErrorPattern{ErrorKind::kPermissionDenied, "invalid_grant"},
    ErrorPattern{ErrorKind::kPermissionDenied, "reauthentication"},
    ErrorPattern{ErrorKind::kPermissionDenied, "permission denied"},
    // transport
    ErrorPattern{ErrorKind::kNetworkFailure, "connection reset"},
    ErrorPattern{ErrorKind::kNetworkFailure, "connection refused"},
    ErrorPattern{ErrorKind::kNetworkFailure, "connection aborted"},
    ErrorPattern{ErrorKind::kNetworkFailure, "timed out"},
    ErrorPattern{ErrorKind::kNetworkFailure, "temporary failure in name resolution"},
    ErrorPattern{ErrorKind::kNetworkFailure, "name or service not known"},
    ErrorPattern{ErrorKind::kNetworkFailure, "unable to find the server"},
    ErrorPattern{ErrorKind::kNetworkFailure, "network is unreachable"},
    ErrorPattern{ErrorKind::kNetworkFailure, "sslerror"},
    ErrorPattern{ErrorKind::kNetworkFailure, "connectionerror"},
    ErrorPattern{ErrorKind::kNetworkFailure, "resumabledownloadexception"},
    ErrorPattern{ErrorKind::kNetworkFailure, "503 service unavailable"},
};

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

} // namespace

std::span<const ErrorPattern> DefaultErrorPatterns() {
    return kErrorPatterns;
}

ErrorKind ClassifyError(int exit_code,
                        std::string_view output,
                        bool terminated,
                        std::span<const ErrorPattern> patterns) {
    if (terminated) {
        return ErrorKind::kCancelled;
    }
    if (exit_code == 0) {
        return ErrorKind::kNone;
    }
    auto lowered = toLower(output);
    for (const auto& pattern : patterns) {
        if (lowered.find(toLower(pattern.needle)) != std::string::npos) {
            return pattern.kind;
        }
    }
    return ErrorKind::kUnknown;
}

} // namespace bucketpull::core
