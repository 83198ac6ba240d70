#pragma once

#include <string>
#include <vector>

#include "stock.h"

namespace rc {
namespace optimizer {

struct PlanViolation {
    enum Kind {
        UnknownStock,     // Assignment references a stock option that does not exist
        UnknownRequest,   // Pattern references a cut request that does not exist
        EmptyPattern,     // Assignment cuts nothing
        PatternOverflow,  // Pieces plus kerf exceed the stock length
        WasteMismatch,    // Recorded used/waste/leftover disagree with the pieces
        StockOverused,    // Stock option used more often than available
        QuantityMismatch, // Complete plan does not meet a request exactly
        ShortageMismatch, // Partial plan: assigned + shortage != required
        StatusMismatch    // Status disagrees with the shortage list
    };
    Kind kind;
    std::string message;
};

// Independently re-check a plan against the job it was built for.
// Returns an empty vector if the plan is consistent. Nothing is corrected.
std::vector<PlanViolation> validatePlan(const Job& job, const CuttingPlan& plan);

// Eager input checks run before optimization. Returns one message per
// problem; empty means the job can be optimized.
std::vector<std::string> checkJobInput(const Job& job);

const char* toString(PlanViolation::Kind kind);

} // namespace optimizer
} // namespace rc
