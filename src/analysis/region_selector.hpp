#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/errors.hpp"
#include "analysis/likelihood_ratio.hpp"
#include "analysis/region.hpp"
#include "analysis/region_evaluator.hpp"

#include <cmath>
#include <string>

// ---------------------------------------------------------------------------
// RegionSelector: most powerful LRT region within a size budget
//
// Only the prefix regions of LikelihoodRatioClassifier are candidates.
// Among those with size <= max_size the highest power wins; equal power
// goes to the smaller size. The empty region (size 0) always qualifies.
// ---------------------------------------------------------------------------
class RegionSelector {
public:
    explicit RegionSelector(const AnalysisConfig& config = {}) : config_(config) {}

    Region select(const DistributionPair& pair, double max_size) const {
        check_budget(max_size);

        LikelihoodRatioClassifier classifier(pair, config_);
        RegionEvaluator evaluator;
        const auto& prefixes = classifier.prefix_regions();

        Region best = prefixes.front();
        RegionStats best_stats = evaluator.evaluate(best, pair);
        for (const auto& r : prefixes) {
            RegionStats s = evaluator.evaluate(r, pair);
            if (s.size > max_size) continue;
            if (improves(s, best_stats)) {
                best = r;
                best_stats = s;
            }
        }
        return best;
    }

    // Same objective over all 2^n regions. Exponential; kept to cross-check
    // select() against the full power set.
    Region select_brute_force(const DistributionPair& pair, double max_size) const {
        check_budget(max_size);
        detail::check_table_outcomes(static_cast<long long>(pair.outcome_count()), config_);

        RegionEvaluator evaluator;
        Region best;
        RegionStats best_stats;
        for (Region r : RegionEnumerator(pair)) {
            RegionStats s = evaluator.evaluate(r, pair);
            if (s.size > max_size) continue;
            if (improves(s, best_stats)) {
                best = std::move(r);
                best_stats = s;
            }
        }
        return best;
    }

private:
    static void check_budget(double max_size) {
        if (std::isnan(max_size) || max_size < 0.0) {
            throw InvalidBudgetError("size budget must be >= 0, got " + std::to_string(max_size));
        }
    }

    static bool improves(const RegionStats& candidate, const RegionStats& best) {
        if (candidate.power != best.power) return candidate.power > best.power;
        return candidate.size < best.size;
    }

    AnalysisConfig config_;
};
