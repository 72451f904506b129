#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/errors.hpp"
#include "analysis/region.hpp"
#include "analysis/region_enumerator.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RegionEvaluator: size and power of rejection regions
//
// size  = sum of null probabilities over the region
// power = sum of alternative probabilities over the region
// Plain floating point accumulation in ascending outcome order; no rounding.
// ---------------------------------------------------------------------------
class RegionEvaluator {
public:
    RegionStats evaluate(const Region& region, const DistributionPair& pair) const {
        RegionStats stats;
        for (size_t outcome : region.outcomes()) {
            if (outcome >= pair.outcome_count()) {
                throw InvalidInputError("region " + region.to_string() + " names outcome " +
                                        std::to_string(outcome) + " outside a domain of " +
                                        std::to_string(pair.outcome_count()));
            }
            stats.size += pair.null_at(outcome);
            stats.power += pair.alt_at(outcome);
        }
        return stats;
    }

    // Every region of the pair's outcome space, in RegionEnumerator order.
    std::vector<EvaluatedRegion> evaluate_all(const DistributionPair& pair,
                                              const AnalysisConfig& config = {}) const {
        detail::check_table_outcomes(static_cast<long long>(pair.outcome_count()), config);
        RegionEnumerator regions(pair);
        std::vector<EvaluatedRegion> out;
        out.reserve(static_cast<size_t>(regions.region_count()));
        for (Region r : regions) {
            RegionStats stats = evaluate(r, pair);
            out.push_back({std::move(r), stats});
        }
        return out;
    }
};
