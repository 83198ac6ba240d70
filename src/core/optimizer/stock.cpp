#include "stock.h"

namespace rc {
namespace optimizer {

int Job::totalPieces() const {
    int total = 0;
    for (const auto& cut : cuts) {
        total += cut.quantity;
    }
    return total;
}

int Pattern::pieceCount() const {
    int total = 0;
    for (const auto& piece : pieces) {
        total += piece.count;
    }
    return total;
}

f64 CuttingPlan::totalWaste() const {
    f64 total = 0.0;
    for (const auto& a : assignments) {
        total += a.pattern.waste;
    }
    return total;
}

f64 CuttingPlan::totalUsed() const {
    f64 total = 0.0;
    for (const auto& a : assignments) {
        total += a.pattern.usedLength;
    }
    return total;
}

int CuttingPlan::assignedQuantity(usize requestIndex) const {
    int total = 0;
    for (const auto& a : assignments) {
        for (const auto& piece : a.pattern.pieces) {
            if (piece.requestIndex == requestIndex) {
                total += piece.count;
            }
        }
    }
    return total;
}

int CuttingPlan::shortageQuantity(usize requestIndex) const {
    int total = 0;
    for (const auto& s : shortages) {
        if (s.requestIndex == requestIndex) {
            total += s.quantity;
        }
    }
    return total;
}

const char* toString(ShortageReason reason) {
    switch (reason) {
    case ShortageReason::Infeasible:
        return "infeasible";
    case ShortageReason::StockExhausted:
        return "stock_exhausted";
    case ShortageReason::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* toString(PlanStatus status) {
    switch (status) {
    case PlanStatus::Complete:
        return "complete";
    case PlanStatus::Partial:
        return "partial";
    }
    return "unknown";
}

const char* toString(JobStatus status) {
    switch (status) {
    case JobStatus::Ok:
        return "ok";
    case JobStatus::InvalidInput:
        return "invalid_input";
    case JobStatus::InternalInconsistency:
        return "internal_inconsistency";
    case JobStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace optimizer
} // namespace rc
