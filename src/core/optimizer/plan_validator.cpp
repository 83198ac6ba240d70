#include "plan_validator.h"

#include <algorithm>
#include <cmath>
#include <set>

#include "../utils/string_utils.h"
#include "optimizer_utils.h"

namespace rc {
namespace optimizer {

namespace {

// Recorded lengths may drift from a recomputation by summation order
constexpr f64 kRecordTolerance = 1e-6;

f64 recordTolerance(f64 stockLength) {
    return std::max(kRecordTolerance, lengthTolerance(stockLength));
}

std::string describeStock(const Job& job, usize index) {
    return "stock '" + job.stock[index].id + "' (" + str::formatLength(job.stock[index].length) +
           ")";
}

std::string describeRequest(const Job& job, usize index) {
    std::string s = "request #" + std::to_string(index) + " (" +
                    str::formatLength(job.cuts[index].length);
    if (!job.cuts[index].label.empty()) {
        s += ", '" + job.cuts[index].label + "'";
    }
    return s + ")";
}

void checkAssignment(const Job& job, usize assignmentIndex, const StockAssignment& a,
                     std::vector<PlanViolation>& out) {
    const std::string where = "assignment #" + std::to_string(assignmentIndex);

    if (a.stockIndex >= job.stock.size()) {
        out.push_back({PlanViolation::UnknownStock,
                       where + ": stock index " + std::to_string(a.stockIndex) +
                           " out of range"});
        return;
    }
    if (a.pattern.empty()) {
        out.push_back({PlanViolation::EmptyPattern, where + ": pattern has no pieces"});
        return;
    }

    f64 pieceSum = 0.0;
    int pieces = 0;
    for (const auto& piece : a.pattern.pieces) {
        if (piece.requestIndex >= job.cuts.size()) {
            out.push_back({PlanViolation::UnknownRequest,
                           where + ": request index " + std::to_string(piece.requestIndex) +
                               " out of range"});
            return;
        }
        if (piece.count <= 0) {
            out.push_back({PlanViolation::EmptyPattern,
                           where + ": non-positive count for " +
                               describeRequest(job, piece.requestIndex)});
            return;
        }
        pieceSum += job.cuts[piece.requestIndex].length * piece.count;
        pieces += piece.count;
    }

    const f64 stockLength = job.stock[a.stockIndex].length;
    const f64 used = consumedLength(pieceSum, pieces, job.material.kerf);
    if (used > stockLength + lengthTolerance(stockLength)) {
        out.push_back({PlanViolation::PatternOverflow,
                       where + ": " + std::to_string(pieces) + " piece(s) consume " +
                           str::formatLength(used) + " of " + describeStock(job, a.stockIndex)});
        return;
    }

    const f64 waste = stockLength - used;
    const f64 tolerance = recordTolerance(stockLength);
    if (std::abs(a.pattern.usedLength - used) > tolerance ||
        std::abs(a.pattern.waste - waste) > tolerance || std::abs(a.leftover - waste) > tolerance) {
        out.push_back({PlanViolation::WasteMismatch,
                       where + ": recorded used/waste/leftover " +
                           str::formatLength(a.pattern.usedLength) + "/" +
                           str::formatLength(a.pattern.waste) + "/" +
                           str::formatLength(a.leftover) + ", expected " +
                           str::formatLength(used) + "/" + str::formatLength(waste)});
    }
}

} // namespace

std::vector<PlanViolation> validatePlan(const Job& job, const CuttingPlan& plan) {
    std::vector<PlanViolation> violations;

    // (a) every assignment fits its stock and records its waste correctly
    std::vector<int> used(job.stock.size(), 0);
    for (usize i = 0; i < plan.assignments.size(); ++i) {
        const auto& a = plan.assignments[i];
        checkAssignment(job, i, a, violations);
        if (a.stockIndex < job.stock.size()) {
            ++used[a.stockIndex];
        }
    }

    // (b) no stock option is used beyond its availability
    for (usize s = 0; s < job.stock.size(); ++s) {
        const auto& option = job.stock[s];
        if (!option.isUnlimited() && used[s] > option.quantity) {
            violations.push_back({PlanViolation::StockOverused,
                                  describeStock(job, s) + " used " + std::to_string(used[s]) +
                                      " time(s), " + std::to_string(option.quantity) +
                                      " available"});
        }
    }

    // Shortages must reference real requests and hold at least one piece
    for (const auto& s : plan.shortages) {
        if (s.requestIndex >= job.cuts.size()) {
            violations.push_back({PlanViolation::UnknownRequest,
                                  "shortage references request index " +
                                      std::to_string(s.requestIndex)});
        }
        if (s.quantity <= 0) {
            violations.push_back({PlanViolation::StatusMismatch,
                                  "shortage for request index " + std::to_string(s.requestIndex) +
                                      " has non-positive quantity " + std::to_string(s.quantity)});
        }
    }

    if (plan.isComplete() && !plan.shortages.empty()) {
        violations.push_back({PlanViolation::StatusMismatch,
                              "complete plan lists " + std::to_string(plan.shortages.size()) +
                                  " shortage(s)"});
    }
    if (!plan.isComplete() && plan.shortages.empty()) {
        violations.push_back({PlanViolation::StatusMismatch, "partial plan lists no shortage"});
    }

    // (c)/(d) conservation of demand
    for (usize i = 0; i < job.cuts.size(); ++i) {
        const int required = job.cuts[i].quantity;
        const int assigned = plan.assignedQuantity(i);
        const int shortage = plan.shortageQuantity(i);

        if (plan.isComplete()) {
            if (assigned != required) {
                violations.push_back({PlanViolation::QuantityMismatch,
                                      describeRequest(job, i) + ": assigned " +
                                          std::to_string(assigned) + ", required " +
                                          std::to_string(required)});
            }
        } else if (assigned > required || shortage < 0 || assigned + shortage != required) {
            violations.push_back({PlanViolation::ShortageMismatch,
                                  describeRequest(job, i) + ": assigned " +
                                      std::to_string(assigned) + " + shortage " +
                                      std::to_string(shortage) + " != required " +
                                      std::to_string(required)});
        }
    }

    return violations;
}

std::vector<std::string> checkJobInput(const Job& job) {
    std::vector<std::string> problems;

    const f64 kerf = job.material.kerf;
    if (!std::isfinite(kerf) || kerf < 0.0) {
        problems.push_back("kerf must be a non-negative number, got " + str::formatLength(kerf));
    }

    f64 smallest = 0.0;
    for (usize i = 0; i < job.cuts.size(); ++i) {
        const auto& cut = job.cuts[i];
        if (!std::isfinite(cut.length) || cut.length <= 0.0) {
            problems.push_back("cut request #" + std::to_string(i) +
                               ": length must be positive, got " +
                               str::formatLength(cut.length));
        } else if (smallest == 0.0 || cut.length < smallest) {
            smallest = cut.length;
        }
        if (cut.quantity < 1) {
            problems.push_back("cut request #" + std::to_string(i) +
                               ": quantity must be at least 1, got " +
                               std::to_string(cut.quantity));
        }
    }

    if (smallest > 0.0 && std::isfinite(kerf) && kerf >= smallest) {
        problems.push_back("kerf " + str::formatLength(kerf) +
                           " is not smaller than the shortest piece " +
                           str::formatLength(smallest));
    }

    std::set<std::string> ids;
    for (usize s = 0; s < job.stock.size(); ++s) {
        const auto& option = job.stock[s];
        const std::string name = "stock option '" + option.id + "'";
        if (!ids.insert(option.id).second) {
            problems.push_back("duplicate " + name);
        }
        if (!std::isfinite(option.length) || option.length <= 0.0) {
            problems.push_back(name + ": length must be positive, got " +
                               str::formatLength(option.length));
        }
        if (option.quantity < 0 && !option.isUnlimited()) {
            problems.push_back(name + ": quantity must be non-negative or unlimited, got " +
                               std::to_string(option.quantity));
        }
        if (!std::isfinite(option.cost) || option.cost < 0.0) {
            problems.push_back(name + ": cost weight must not be negative, got " +
                               str::formatLength(option.cost));
        }
    }

    return problems;
}

const char* toString(PlanViolation::Kind kind) {
    switch (kind) {
    case PlanViolation::UnknownStock:
        return "unknown_stock";
    case PlanViolation::UnknownRequest:
        return "unknown_request";
    case PlanViolation::EmptyPattern:
        return "empty_pattern";
    case PlanViolation::PatternOverflow:
        return "pattern_overflow";
    case PlanViolation::WasteMismatch:
        return "waste_mismatch";
    case PlanViolation::StockOverused:
        return "stock_overused";
    case PlanViolation::QuantityMismatch:
        return "quantity_mismatch";
    case PlanViolation::ShortageMismatch:
        return "shortage_mismatch";
    case PlanViolation::StatusMismatch:
        return "status_mismatch";
    }
    return "unknown";
}

} // namespace optimizer
} // namespace rc
