#pragma once

#include <string>
#include <vector>

#include "../optimizer/stock.h"

namespace rc {

// Load result with optional error message
struct JobLoadResult {
    std::vector<optimizer::Job> jobs;
    std::string error;

    bool success() const { return error.empty(); }
    explicit operator bool() const { return success(); }
};

} // namespace rc
