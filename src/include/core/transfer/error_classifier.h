#pragma once

#include <core/model/transfer_outcome.h>
#include <span>
#include <string_view>

namespace bucketpull::core {

struct ErrorPattern {
    ErrorKind kind;
    std::string_view needle; // matched case-insensitively against the tool output
};

// Ordered table, first match wins. Local filesystem errors come before the
// remote permission rules because both mention "permission denied".
std::span<const ErrorPattern> DefaultErrorPatterns();

// Exhaustive over (exit code, output): a terminated process is kCancelled,
// exit code 0 is kNone, anything unmatched is kUnknown.
ErrorKind ClassifyError(int exit_code,
                        std::string_view output,
                        bool terminated = false,
                        std::span<const ErrorPattern> patterns = DefaultErrorPatterns());

} // namespace bucketpull::core
