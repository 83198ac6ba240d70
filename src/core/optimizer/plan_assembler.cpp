#include "plan_assembler.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

#include "../utils/log.h"
#include "optimizer_utils.h"

namespace rc {
namespace optimizer {

namespace {

constexpr f64 kScoreEpsilon = 1e-9;

struct Choice {
    usize stockIndex = 0;
    Pattern pattern;
    f64 score = 0.0; // Cost-weighted waste, lower is better
    f64 cost = 0.0;
};

bool isBetter(const Choice& a, const Choice& b, const std::vector<StockOption>& stock) {
    if (std::abs(a.score - b.score) > kScoreEpsilon) {
        return a.score < b.score;
    }
    if (std::abs(a.cost - b.cost) > kScoreEpsilon) {
        return a.cost < b.cost;
    }
    if (std::abs(a.pattern.longestPiece - b.pattern.longestPiece) > kLengthEpsilon) {
        return a.pattern.longestPiece > b.pattern.longestPiece;
    }
    const std::string& idA = stock[a.stockIndex].id;
    const std::string& idB = stock[b.stockIndex].id;
    if (idA != idB) {
        return idA < idB;
    }
    return a.stockIndex < b.stockIndex;
}

bool hasDemand(const std::vector<int>& remaining) {
    return std::any_of(remaining.begin(), remaining.end(), [](int r) { return r > 0; });
}

void recordShortages(const std::vector<int>& remaining, ShortageReason reason,
                     std::vector<Shortage>& out) {
    for (usize i = 0; i < remaining.size(); ++i) {
        if (remaining[i] > 0) {
            out.push_back({i, remaining[i], reason});
        }
    }
}

i64 unmetPieces(const CuttingPlan& plan) {
    i64 unmet = 0;
    for (const auto& s : plan.shortages) {
        unmet += s.quantity;
    }
    return unmet;
}

// Fewer unmet pieces, then less waste, then fewer units
bool ranksBefore(const CuttingPlan& a, const CuttingPlan& b) {
    const i64 unmetA = unmetPieces(a);
    const i64 unmetB = unmetPieces(b);
    if (unmetA != unmetB) {
        return unmetA < unmetB;
    }
    const f64 wasteA = a.totalWaste();
    const f64 wasteB = b.totalWaste();
    if (std::abs(wasteA - wasteB) > lengthTolerance(std::max(wasteA, wasteB))) {
        return wasteA < wasteB;
    }
    return a.unitsUsed() < b.unitsUsed();
}

// Units a plan takes from each of the given stock options
std::vector<int> unitsTaken(const CuttingPlan& plan, const std::vector<usize>& options) {
    std::vector<int> taken(options.size(), 0);
    for (const auto& a : plan.assignments) {
        for (usize d = 0; d < options.size(); ++d) {
            if (options[d] == a.stockIndex) {
                ++taken[d];
            }
        }
    }
    return taken;
}

// Caps already decided by an earlier pass. A pass with caps `caps` that took
// `taken` units yields the same plan for every cap vector in [taken, caps]:
// lowering a cap the pass never reached only hides an option it did not pick.
struct DecidedRange {
    std::vector<int> caps;
    std::vector<int> taken;

    bool covers(const std::vector<int>& x) const {
        for (usize d = 0; d < x.size(); ++d) {
            if (x[d] < taken[d] || x[d] > caps[d]) {
                return false;
            }
        }
        return true;
    }
};

// Cap vectors below `top`, in descending lexicographic order. With
// `exhaustive` false only the single-unit reductions are produced.
std::vector<std::vector<int>> lowerCaps(const std::vector<int>& top, bool exhaustive) {
    std::vector<std::vector<int>> out;
    if (!exhaustive) {
        for (usize d = 0; d < top.size(); ++d) {
            std::vector<int> caps = top;
            --caps[d];
            out.push_back(std::move(caps));
        }
        return out;
    }

    std::vector<int> caps = top;
    for (;;) {
        usize d = caps.size();
        while (d > 0 && caps[d - 1] == 0) {
            --d;
        }
        if (d == 0) {
            break;
        }
        --caps[d - 1];
        for (usize k = d; k < caps.size(); ++k) {
            caps[k] = top[k];
        }
        out.push_back(caps);
    }
    return out;
}

} // namespace

const char* toString(AssemblerState state) {
    switch (state) {
    case AssemblerState::PendingDemand:
        return "pending_demand";
    case AssemblerState::SelectingPattern:
        return "selecting_pattern";
    case AssemblerState::Commit:
        return "commit";
    case AssemblerState::Satisfied:
        return "satisfied";
    case AssemblerState::StockExhausted:
        return "stock_exhausted";
    case AssemblerState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

CuttingPlan PlanAssembler::assemble(const Job& job, const CancelToken* cancel) {
    m_state = AssemblerState::PendingDemand;
    m_iterations = 0;
    m_passes = 0;
    m_hitCeiling = false;

    std::vector<int> remaining(job.cuts.size(), 0);
    for (usize i = 0; i < job.cuts.size(); ++i) {
        remaining[i] = std::max(0, job.cuts[i].quantity);
    }

    std::vector<int> available(job.stock.size(), 0);
    for (usize s = 0; s < job.stock.size(); ++s) {
        available[s] = job.stock[s].quantity;
    }

    // A piece longer than every stock option can never be cut; a single piece
    // needs no kerf, so the plain length decides.
    std::vector<Shortage> infeasible;
    const f64 longest = longestStockLength(job.stock);
    i64 pieces = 0;
    for (usize i = 0; i < job.cuts.size(); ++i) {
        if (remaining[i] > 0 && job.cuts[i].length > longest + lengthTolerance(longest)) {
            log::warningf("Assembler", "Job '%s': piece %.3f exceeds longest stock %.3f",
                          job.id.c_str(), job.cuts[i].length, longest);
            infeasible.push_back({i, remaining[i], ShortageReason::Infeasible});
            remaining[i] = 0;
        }
        pieces += remaining[i];
    }

    Pass best = runPass(job, remaining, available, infeasible, cancel);
    if (best.state != AssemblerState::Cancelled && pieces > 0) {
        const i64 limit = std::numeric_limits<int>::max();
        compareStockVariants(job, remaining, infeasible, static_cast<int>(std::min(pieces, limit)),
                             cancel, best);
    }

    m_state = best.state;
    m_iterations = best.iterations;

    if (m_state == AssemblerState::StockExhausted) {
        log::warningf("Assembler", "Job '%s': stock exhausted with %zu request(s) short",
                      job.id.c_str(), best.plan.shortages.size());
    }
    log::debugf("Assembler", "Job '%s': %s after %zu unit(s) and %zu pass(es), waste %.3f",
                job.id.c_str(), toString(m_state), m_iterations, m_passes,
                best.plan.totalWaste());
    return std::move(best.plan);
}

void PlanAssembler::compareStockVariants(const Job& job, const std::vector<int>& remaining,
                                         const std::vector<Shortage>& infeasible, int pieces,
                                         const CancelToken* cancel, Pass& best) {
    // Limited options with units to take away. A cap of `pieces` already
    // behaves as unlimited, since every unit holds at least one piece.
    std::vector<usize> options;
    std::vector<int> top;
    for (usize s = 0; s < job.stock.size(); ++s) {
        const StockOption& option = job.stock[s];
        if (!option.isUnlimited() && option.quantity > 0) {
            options.push_back(s);
            top.push_back(std::min(option.quantity, pieces));
        }
    }
    if (options.empty()) {
        return;
    }

    bool exhaustive = true;
    usize variants = 1;
    for (int cap : top) {
        const usize values = static_cast<usize>(cap) + 1;
        if (variants > m_maxStockVariants / values) {
            exhaustive = false;
            break;
        }
        variants *= values;
    }
    if (!exhaustive) {
        log::debugf("Assembler", "Job '%s': over %zu stock variants, trying single-unit cuts",
                    job.id.c_str(), m_maxStockVariants);
    }

    std::vector<int> available(job.stock.size(), 0);
    for (usize s = 0; s < job.stock.size(); ++s) {
        available[s] = job.stock[s].quantity;
    }

    std::vector<DecidedRange> decided;
    decided.push_back({top, unitsTaken(best.plan, options)});

    for (const auto& caps : lowerCaps(top, exhaustive)) {
        if (cancel && cancel->isCancelled()) {
            break;
        }
        bool known = false;
        for (const auto& range : decided) {
            if (range.covers(caps)) {
                known = true;
                break;
            }
        }
        if (known) {
            continue;
        }

        for (usize d = 0; d < options.size(); ++d) {
            available[options[d]] = caps[d];
        }
        Pass pass = runPass(job, remaining, available, infeasible, cancel);
        if (pass.state == AssemblerState::Cancelled) {
            break;
        }

        decided.push_back({caps, unitsTaken(pass.plan, options)});
        if (ranksBefore(pass.plan, best.plan)) {
            best = std::move(pass);
        }
    }
}

PlanAssembler::Pass PlanAssembler::runPass(const Job& job, std::vector<int> remaining,
                                           std::vector<int> available,
                                           const std::vector<Shortage>& infeasible,
                                           const CancelToken* cancel) {
    ++m_passes;

    Pass pass;
    pass.plan.shortages = infeasible;
    const f64 kerf = job.material.kerf;

    while (hasDemand(remaining)) {
        if (cancel && cancel->isCancelled()) {
            pass.state = AssemblerState::Cancelled;
            recordShortages(remaining, ShortageReason::Cancelled, pass.plan.shortages);
            break;
        }

        m_state = AssemblerState::SelectingPattern;
        const auto demand = snapshotDemand(job, remaining);

        std::optional<Choice> best;
        for (usize s = 0; s < job.stock.size(); ++s) {
            if (available[s] == 0) {
                continue;
            }

            const StockOption& option = job.stock[s];
            bool truncated = false;
            auto pattern = m_generator.bestPattern(option.length, kerf, demand, &truncated);
            m_hitCeiling = m_hitCeiling || truncated;
            if (!pattern) {
                continue;
            }

            Choice choice;
            choice.stockIndex = s;
            choice.cost = option.costWeight();
            choice.score = pattern->waste * (choice.cost / option.length);
            choice.pattern = std::move(*pattern);

            if (!best || isBetter(choice, *best, job.stock)) {
                best = std::move(choice);
            }
        }

        if (!best) {
            pass.state = AssemblerState::StockExhausted;
            recordShortages(remaining, ShortageReason::StockExhausted, pass.plan.shortages);
            break;
        }

        m_state = AssemblerState::Commit;
        for (const auto& piece : best->pattern.pieces) {
            remaining[piece.requestIndex] -= piece.count;
        }
        if (available[best->stockIndex] != kUnlimitedQuantity) {
            --available[best->stockIndex];
        }

        StockAssignment assignment;
        assignment.stockIndex = best->stockIndex;
        assignment.leftover = best->pattern.waste;
        assignment.pattern = std::move(best->pattern);
        pass.plan.assignments.push_back(std::move(assignment));
        ++pass.iterations;
    }

    std::sort(pass.plan.shortages.begin(), pass.plan.shortages.end(),
              [](const Shortage& a, const Shortage& b) { return a.requestIndex < b.requestIndex; });

    if (pass.plan.shortages.empty()) {
        pass.plan.status = PlanStatus::Complete;
        pass.state = AssemblerState::Satisfied;
    } else {
        pass.plan.status = PlanStatus::Partial;
        if (pass.state != AssemblerState::Cancelled) {
            pass.state = AssemblerState::StockExhausted;
        }
    }
    return pass;
}

} // namespace optimizer
} // namespace rc
