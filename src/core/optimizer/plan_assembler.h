#pragma once

#include <vector>

#include "cancel_token.h"
#include "pattern_generator.h"
#include "stock.h"

namespace rc {
namespace optimizer {

// Default ceiling on stock availability variants compared per job
inline constexpr usize kDefaultMaxStockVariants = 1024;

enum class AssemblerState {
    PendingDemand,
    SelectingPattern,
    Commit,
    Satisfied,
    StockExhausted,
    Cancelled
};

const char* toString(AssemblerState state);

// Builds a cutting plan for one job by repeatedly committing the best
// (stock option, pattern) pair against the remaining demand.
//
// Pairs are ranked by cost-weighted waste, waste * costWeight / length, so
// with default costs the ranking is by waste length. Ties go to the lower
// cost weight, then to the pattern holding the longest piece, then to the
// smaller stock option id.
//
// A single greedy pass can waste more when a limited option gains a unit,
// because the extra unit lures pieces away from a shared one. The assembler
// therefore repeats the pass with every limited option capped at each lower
// availability and keeps the plan that places the most pieces, then wastes
// least, then uses the fewest units. Adding units to a limited option never
// worsens that ranking as long as the variants fit in maxStockVariants; above
// that only the single-unit reductions are tried.
//
// Not thread-safe: use one assembler per job (they are cheap).
class PlanAssembler {
  public:
    PlanAssembler() = default;
    explicit PlanAssembler(GeneratorLimits limits,
                           usize maxStockVariants = kDefaultMaxStockVariants)
        : m_generator(limits), m_maxStockVariants(maxStockVariants) {}

    // Never throws on a short supply: unmet demand is returned as a partial
    // plan with one shortage entry per unmet request. A cancel observed
    // during the first pass keeps the units committed so far; one observed
    // while comparing variants keeps the best plan found.
    CuttingPlan assemble(const Job& job, const CancelToken* cancel = nullptr);

    // Final state of the last assemble() call
    AssemblerState lastState() const { return m_state; }

    // Patterns committed by the plan the last assemble() call returned
    usize iterations() const { return m_iterations; }

    // Greedy passes run by the last assemble() call
    usize passes() const { return m_passes; }

    // True if the combination ceiling triggered at least once
    bool hitCombinationCeiling() const { return m_hitCeiling; }

  private:
    struct Pass {
        CuttingPlan plan;
        AssemblerState state = AssemblerState::PendingDemand;
        usize iterations = 0;
    };

    Pass runPass(const Job& job, std::vector<int> remaining, std::vector<int> available,
                 const std::vector<Shortage>& infeasible, const CancelToken* cancel);

    void compareStockVariants(const Job& job, const std::vector<int>& remaining,
                              const std::vector<Shortage>& infeasible, int pieces,
                              const CancelToken* cancel, Pass& best);

    PatternGenerator m_generator;
    usize m_maxStockVariants = kDefaultMaxStockVariants;
    AssemblerState m_state = AssemblerState::PendingDemand;
    usize m_iterations = 0;
    usize m_passes = 0;
    bool m_hitCeiling = false;
};

} // namespace optimizer
} // namespace rc
