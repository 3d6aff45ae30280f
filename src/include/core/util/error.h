#pragma once

#include <stdexcept>

namespace bucketpull::core {

// Raised before any transfer starts when a selection cannot become a plan.
class PlanningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace bucketpull::core
