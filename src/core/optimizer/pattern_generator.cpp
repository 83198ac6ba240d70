#include "pattern_generator.h"

#include <algorithm>
#include <cmath>

#include "../utils/log.h"

namespace rc {
namespace optimizer {

namespace {

// Waste values closer than this rank as equal
constexpr f64 kWasteQuantum = 1e-6;

// All outstanding requests sharing one piece length
struct LengthGroup {
    f64 length = 0.0;
    int remaining = 0;
    std::vector<DemandEntry> requests; // Request order
};

struct Candidate {
    std::vector<int> counts; // Parallel to the length groups
    f64 used = 0.0;
    f64 waste = 0.0;
    i64 wasteKey = 0;
};

bool ranksBefore(const Candidate& a, const Candidate& b) {
    if (a.wasteKey != b.wasteKey) {
        return a.wasteKey < b.wasteKey;
    }
    return a.counts > b.counts;
}

std::vector<LengthGroup> groupByLength(const std::vector<DemandEntry>& demand) {
    std::vector<DemandEntry> sorted;
    sorted.reserve(demand.size());
    for (const auto& d : demand) {
        if (d.remaining > 0 && d.length > 0.0) {
            sorted.push_back(d);
        }
    }

    std::sort(sorted.begin(), sorted.end(), [](const DemandEntry& a, const DemandEntry& b) {
        if (a.length != b.length) {
            return a.length > b.length;
        }
        return a.requestIndex < b.requestIndex;
    });

    std::vector<LengthGroup> groups;
    for (const auto& d : sorted) {
        if (groups.empty() || groups.back().length - d.length > lengthTolerance(d.length)) {
            groups.push_back({d.length, 0, {}});
        }
        groups.back().remaining += d.remaining;
        groups.back().requests.push_back(d);
    }

    for (auto& g : groups) {
        std::sort(g.requests.begin(), g.requests.end(),
                  [](const DemandEntry& a, const DemandEntry& b) {
                      return a.requestIndex < b.requestIndex;
                  });
    }
    return groups;
}

// Depth-first bounded knapsack over the length groups, longest length and
// largest multiplicity first. Each piece consumes length + kerf out of a
// capacity of stockLength + kerf.
class KnapsackSearch {
  public:
    KnapsackSearch(const std::vector<LengthGroup>& groups, f64 stockLength, f64 kerf,
                   usize maxLeaves, bool keepAll)
        : m_groups(groups), m_stockLength(stockLength), m_kerf(kerf),
          m_tolerance(lengthTolerance(stockLength + kerf)),
          m_maxLeaves(std::max<usize>(1, maxLeaves)), m_keepAll(keepAll) {}

    void run() {
        m_counts.assign(m_groups.size(), 0);
        visit(0, 0.0, 0);
        if (m_truncated) {
            addGreedyFill();
        }
    }

    bool truncated() const { return m_truncated; }
    std::vector<Candidate>& candidates() { return m_candidates; }
    const std::optional<Candidate>& best() const { return m_best; }

  private:
    Candidate makeCandidate(const std::vector<int>& counts) const {
        f64 pieceSum = 0.0;
        int pieces = 0;
        for (usize g = 0; g < counts.size(); ++g) {
            pieceSum += m_groups[g].length * counts[g];
            pieces += counts[g];
        }

        Candidate c;
        c.counts = counts;
        c.used = consumedLength(pieceSum, pieces, m_kerf);
        c.waste = std::max(0.0, m_stockLength - c.used);
        c.wasteKey = static_cast<i64>(std::llround(c.waste / kWasteQuantum));
        return c;
    }

    void offer(Candidate c) {
        if (!m_best || ranksBefore(c, *m_best)) {
            m_best = c;
        }
        if (m_keepAll) {
            m_candidates.push_back(std::move(c));
        }
    }

    void visit(usize level, f64 pieceSum, int pieces) {
        if (level == m_groups.size()) {
            if (pieces == 0) {
                return;
            }
            if (m_leaves >= m_maxLeaves) {
                m_truncated = true;
                return;
            }
            ++m_leaves;
            offer(makeCandidate(m_counts));
            return;
        }

        const LengthGroup& group = m_groups[level];
        const f64 unit = group.length + m_kerf;
        const f64 room = (m_stockLength + m_kerf) - (pieceSum + m_kerf * pieces);

        int maxFit = 0;
        if (room + m_tolerance >= unit) {
            maxFit = static_cast<int>(std::floor((room + m_tolerance) / unit));
        }
        const int upper = std::min(group.remaining, maxFit);

        for (int m = upper; m >= 0; --m) {
            m_counts[level] = m;
            visit(level + 1, pieceSum + group.length * m, pieces + m);
            if (m_truncated) {
                break;
            }
        }
        m_counts[level] = 0;
    }

    // Repeat the longest piece that fits, as often as it fits and is needed
    void addGreedyFill() {
        for (usize g = 0; g < m_groups.size(); ++g) {
            const LengthGroup& group = m_groups[g];
            if (group.length > m_stockLength + m_tolerance) {
                continue;
            }

            const f64 unit = group.length + m_kerf;
            const int fit =
                static_cast<int>(std::floor((m_stockLength + m_kerf + m_tolerance) / unit));
            std::vector<int> counts(m_groups.size(), 0);
            counts[g] = std::max(1, std::min(group.remaining, fit));

            if (m_keepAll) {
                for (const auto& c : m_candidates) {
                    if (c.counts == counts) {
                        return;
                    }
                }
            }
            offer(makeCandidate(counts));
            return;
        }
    }

    const std::vector<LengthGroup>& m_groups;
    f64 m_stockLength;
    f64 m_kerf;
    f64 m_tolerance;
    usize m_maxLeaves;
    bool m_keepAll;

    std::vector<int> m_counts;
    usize m_leaves = 0;
    bool m_truncated = false;
    std::vector<Candidate> m_candidates;
    std::optional<Candidate> m_best;
};

Pattern toPattern(const Candidate& c, const std::vector<LengthGroup>& groups) {
    Pattern pattern;
    pattern.usedLength = c.used;
    pattern.waste = c.waste;

    for (usize g = 0; g < groups.size(); ++g) {
        int left = c.counts[g];
        if (left == 0) {
            continue;
        }
        if (pattern.pieces.empty()) {
            pattern.longestPiece = groups[g].length;
        }
        // Earlier requests of the same length are filled first
        for (const auto& req : groups[g].requests) {
            int take = std::min(left, req.remaining);
            if (take > 0) {
                pattern.pieces.push_back({req.requestIndex, take});
                left -= take;
            }
            if (left == 0) {
                break;
            }
        }
    }
    return pattern;
}

} // namespace

PatternSet PatternGenerator::generate(f64 stockLength, f64 kerf,
                                      const std::vector<DemandEntry>& demand) const {
    PatternSet set;
    if (stockLength <= 0.0) {
        return set;
    }

    auto groups = groupByLength(demand);
    if (groups.empty()) {
        return set;
    }

    KnapsackSearch search(groups, stockLength, std::max(0.0, kerf), m_limits.maxCombinations,
                          true);
    search.run();

    auto& candidates = search.candidates();
    std::sort(candidates.begin(), candidates.end(), ranksBefore);

    set.m_patterns.reserve(candidates.size());
    for (const auto& c : candidates) {
        set.m_patterns.push_back(toPattern(c, groups));
    }
    set.m_truncated = search.truncated();

    if (set.m_truncated) {
        log::debugf("PatternGen", "Ceiling of %zu combinations hit for stock %.3f",
                    m_limits.maxCombinations, stockLength);
    }
    return set;
}

std::optional<Pattern> PatternGenerator::bestPattern(f64 stockLength, f64 kerf,
                                                     const std::vector<DemandEntry>& demand,
                                                     bool* truncated) const {
    if (truncated) {
        *truncated = false;
    }
    if (stockLength <= 0.0) {
        return std::nullopt;
    }

    auto groups = groupByLength(demand);
    if (groups.empty()) {
        return std::nullopt;
    }

    KnapsackSearch search(groups, stockLength, std::max(0.0, kerf), m_limits.maxCombinations,
                          false);
    search.run();

    if (truncated) {
        *truncated = search.truncated();
    }
    if (!search.best()) {
        return std::nullopt;
    }
    return toPattern(*search.best(), groups);
}

} // namespace optimizer
} // namespace rc
