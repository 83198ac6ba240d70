#pragma once

#include <algorithm>
#include <vector>

#include "stock.h"

namespace rc {
namespace optimizer {

// Outstanding demand for one cut request, as seen by the pattern generator
struct DemandEntry {
    usize requestIndex;
    f64 length;
    int remaining;
};

// Snapshot of the requests that still need pieces, in request order.
// `remaining` is parallel to job.cuts.
inline std::vector<DemandEntry> snapshotDemand(const Job& job, const std::vector<int>& remaining) {
    std::vector<DemandEntry> demand;
    for (usize i = 0; i < job.cuts.size() && i < remaining.size(); ++i) {
        if (remaining[i] > 0) {
            demand.push_back({i, job.cuts[i].length, remaining[i]});
        }
    }
    return demand;
}

// Longest stock length of a job, ignoring availability
inline f64 longestStockLength(const std::vector<StockOption>& stock) {
    f64 longest = 0.0;
    for (const auto& s : stock) {
        longest = std::max(longest, s.length);
    }
    return longest;
}

// Length consumed by n pieces of total length `pieces`: kerf falls between
// neighbouring pieces, the last piece takes the tail of the stock.
inline f64 consumedLength(f64 pieces, int count, f64 kerf) {
    return count > 0 ? pieces + kerf * static_cast<f64>(count - 1) : 0.0;
}

} // namespace optimizer
} // namespace rc
