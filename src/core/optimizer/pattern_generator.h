#pragma once

#include <optional>
#include <vector>

#include "optimizer_utils.h"
#include "stock.h"

namespace rc {
namespace optimizer {

// Default ceiling on combinations explored per stock length
inline constexpr usize kDefaultMaxCombinations = 20000;

struct GeneratorLimits {
    usize maxCombinations = kDefaultMaxCombinations;
};

// Candidate patterns for one stock length, best first:
// least waste, then the lexicographically greatest multiplicities over
// piece lengths sorted longest first.
class PatternSet {
  public:
    using const_iterator = std::vector<Pattern>::const_iterator;

    bool empty() const { return m_patterns.empty(); }
    usize size() const { return m_patterns.size(); }
    // Requires !empty()
    const Pattern& best() const { return m_patterns.front(); }
    const Pattern& operator[](usize i) const { return m_patterns[i]; }

    // True when the combination ceiling stopped the search early and the
    // greedy-fill pattern was added
    bool truncated() const { return m_truncated; }

    const_iterator begin() const { return m_patterns.begin(); }
    const_iterator end() const { return m_patterns.end(); }

  private:
    friend class PatternGenerator;

    std::vector<Pattern> m_patterns;
    bool m_truncated = false;
};

// Enumerates the ways to cut a single stock length into the outstanding
// pieces (bounded knapsack). Stateless apart from its limits; every call is
// independent and deterministic.
class PatternGenerator {
  public:
    PatternGenerator() = default;
    explicit PatternGenerator(GeneratorLimits limits) : m_limits(limits) {}

    const GeneratorLimits& limits() const { return m_limits; }

    // All candidate patterns. Empty when no outstanding piece fits.
    PatternSet generate(f64 stockLength, f64 kerf, const std::vector<DemandEntry>& demand) const;

    // Only the first pattern generate() would return, without materializing
    // the rest. `truncated` (optional) reports whether the ceiling triggered.
    std::optional<Pattern> bestPattern(f64 stockLength, f64 kerf,
                                       const std::vector<DemandEntry>& demand,
                                       bool* truncated = nullptr) const;

  private:
    GeneratorLimits m_limits;
};

} // namespace optimizer
} // namespace rc
