#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/dominance.hpp"
#include "analysis/errors.hpp"
#include "analysis/likelihood_ratio.hpp"
#include "analysis/region.hpp"
#include "analysis/region_evaluator.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RegionRow: one rejection region with everything known about it
// ---------------------------------------------------------------------------
struct RegionRow {
    Region region;
    RegionStats stats;
    bool dominated = false;
    bool lrt = false;
};

// ---------------------------------------------------------------------------
// RegionTableBuilder: evaluates every region, then flags dominance and LRTs
//
// Rows follow RegionEnumerator order. Dominance runs over the completed
// stats table.
// ---------------------------------------------------------------------------
class RegionTableBuilder {
public:
    explicit RegionTableBuilder(const AnalysisConfig& config = {}) : config_(config) {}

    std::vector<RegionRow> build(const DistributionPair& pair) const {
        auto evaluated = RegionEvaluator().evaluate_all(pair, config_);
        auto dominated = DominanceAnalyzer().dominated_flags(evaluated);
        LikelihoodRatioClassifier classifier(pair, config_);

        std::vector<RegionRow> rows;
        rows.reserve(evaluated.size());
        for (size_t i = 0; i < evaluated.size(); ++i) {
            RegionRow row;
            row.lrt = classifier.is_lrt(evaluated[i].region);
            row.region = std::move(evaluated[i].region);
            row.stats = evaluated[i].stats;
            row.dominated = dominated[i];
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    AnalysisConfig config_;
};
