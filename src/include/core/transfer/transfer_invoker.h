#pragma once

#include <core/model/transfer_outcome.h>
#include <core/transfer/transfer_mechanism.h>
#include <stop_token>

namespace bucketpull::core {

// Runs one task through the mechanism and turns what it reported into a
// TransferOutcome. Never throws for task-level failures.
class TransferInvoker {
public:
    explicit TransferInvoker(TransferMechanism& mechanism);

    TransferOutcome Execute(const TransferTask& task, int threads, std::stop_token stop_token) const;

private:
    TransferMechanism& mechanism_;
};

} // namespace bucketpull::core
