#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "../types.h"

namespace rc {
namespace optimizer {

// Tolerance for length comparisons on lengths of order one
inline constexpr f64 kLengthEpsilon = 1e-9;

// Tolerance for comparisons against a length of magnitude `scale`. Grows with
// the scale so summation drift on long stock stays inside it.
inline f64 lengthTolerance(f64 scale) {
    return kLengthEpsilon * std::max<f64>(1.0, scale < 0.0 ? -scale : scale);
}

// StockOption::quantity value meaning "no inventory limit"
inline constexpr int kUnlimitedQuantity = -1;

// Material being cut, e.g. one wire item number
struct Material {
    std::string id;
    f64 kerf = 0.0; // Lost per cut

    Material() = default;
    explicit Material(std::string id_, f64 kerf_ = 0.0) : id(std::move(id_)), kerf(kerf_) {}
};

// One kind of raw stock available for a material (a reel, a bar length)
struct StockOption {
    std::string id;
    f64 length = 0.0;
    int quantity = kUnlimitedQuantity; // Units available, or kUnlimitedQuantity
    f64 cost = 0.0;                    // Relative cost weight (0 = same as length)

    StockOption() = default;
    StockOption(std::string id_, f64 len, int qty = kUnlimitedQuantity, f64 cost_ = 0.0)
        : id(std::move(id_)), length(len), quantity(qty), cost(cost_) {}

    bool isUnlimited() const { return quantity == kUnlimitedQuantity; }
    f64 costWeight() const { return cost > 0.0 ? cost : length; }
};

// A requested piece length and how many are needed
struct CutRequest {
    f64 length = 0.0;
    int quantity = 1;
    std::string label; // Optional, carried through for traceability

    CutRequest() = default;
    CutRequest(f64 len, int qty = 1, std::string label_ = {})
        : length(len), quantity(qty), label(std::move(label_)) {}
};

// Everything needed to optimize one material
struct Job {
    std::string id;
    Material material;
    std::vector<CutRequest> cuts;
    std::vector<StockOption> stock;

    int totalPieces() const;
};

// Pieces of one request inside a pattern
struct PatternPiece {
    usize requestIndex = 0;
    int count = 0;
};

// How one stock unit is cut
struct Pattern {
    std::vector<PatternPiece> pieces; // Longest length first
    f64 usedLength = 0.0;             // Pieces plus kerf between them
    f64 waste = 0.0;                  // Stock length minus usedLength
    f64 longestPiece = 0.0;

    bool empty() const { return pieces.empty(); }
    int pieceCount() const;
};

// One consumed unit of a stock option
struct StockAssignment {
    usize stockIndex = 0; // Index into Job::stock
    Pattern pattern;
    f64 leftover = 0.0;
};

enum class ShortageReason {
    Infeasible,     // Piece is longer than every stock option
    StockExhausted, // Stock ran out before the demand was met
    Cancelled       // Batch was cancelled before the demand was met
};

struct Shortage {
    usize requestIndex = 0;
    int quantity = 0;
    ShortageReason reason = ShortageReason::StockExhausted;
};

enum class PlanStatus { Complete, Partial };

// Cut plan for one job
struct CuttingPlan {
    std::vector<StockAssignment> assignments;
    std::vector<Shortage> shortages; // Sorted by request index
    PlanStatus status = PlanStatus::Complete;

    bool isComplete() const { return status == PlanStatus::Complete; }
    int unitsUsed() const { return static_cast<int>(assignments.size()); }
    f64 totalWaste() const;
    f64 totalUsed() const;

    // Pieces of a request placed across all assignments
    int assignedQuantity(usize requestIndex) const;
    int shortageQuantity(usize requestIndex) const;
};

enum class JobStatus {
    Ok,                    // Plan produced and validated (may still be partial)
    InvalidInput,          // Job rejected before optimization
    InternalInconsistency, // Validator rejected the assembler's plan
    Cancelled              // Batch cancelled before or during this job
};

struct JobResult {
    std::string jobId;
    std::string materialId;
    f64 kerf = 0.0;

    // Copy of the job's inputs, so request and stock indices in the plan
    // resolve without the original Job
    std::vector<CutRequest> cuts;
    std::vector<StockOption> stock;

    JobStatus status = JobStatus::Ok;
    CuttingPlan plan;
    std::vector<std::string> errors;

    // Statistics, filled for every status that carries a plan
    std::vector<int> unitsPerStock; // Parallel to Job::stock
    int unitsUsed = 0;
    f64 stockLength = 0.0; // Total length of consumed stock
    f64 usedLength = 0.0;
    f64 wasteLength = 0.0;

    bool isComplete() const { return status == JobStatus::Ok && plan.isComplete(); }
    f64 efficiency() const { return stockLength > 0.0 ? usedLength / stockLength : 0.0; }
};

const char* toString(ShortageReason reason);
const char* toString(PlanStatus status);
const char* toString(JobStatus status);

} // namespace optimizer
} // namespace rc
