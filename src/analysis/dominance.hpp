#pragma once

#include "analysis/region.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace detail {

// b dominates a: no larger size, no smaller power, and strictly better in one.
inline bool dominates(const RegionStats& b, const RegionStats& a) {
    return b.size <= a.size && b.power >= a.power &&
           (b.size < a.size || b.power > a.power);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// DominanceAnalyzer: Pareto dominance over evaluated regions
//
// A region is dominated iff another entry has size <= and power >= its
// own with at least one strict. Entries with identical (size, power) do
// not dominate each other. Exact pairwise comparison, O(R^2).
// ---------------------------------------------------------------------------
class DominanceAnalyzer {
public:
    // Flags aligned with the input order.
    std::vector<bool> dominated_flags(const std::vector<EvaluatedRegion>& entries) const {
        size_t m = entries.size();
        std::vector<bool> flags(m, false);
        for (size_t i = 0; i < m; ++i) {
            for (size_t j = 0; j < m; ++j) {
                if (i == j) continue;
                if (detail::dominates(entries[j].stats, entries[i].stats)) {
                    flags[i] = true;
                    break;
                }
            }
        }
        return flags;
    }

    std::map<Region, bool> analyze(const std::vector<EvaluatedRegion>& entries) const {
        auto flags = dominated_flags(entries);
        std::map<Region, bool> out;
        for (size_t i = 0; i < entries.size(); ++i) {
            out[entries[i].region] = flags[i];
        }
        return out;
    }
};
