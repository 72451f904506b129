#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/region.hpp"
#include "analysis/region_enumerator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <set>
#include <vector>

// ---------------------------------------------------------------------------
// OutcomeRatio: likelihood ratio alt(x) / null(x) of one outcome
//
//   null = 0, alt > 0  ->  +inf (ranked first)
//   null = 0, alt = 0  ->  NaN, outcome carries no evidence (ranked last)
// ---------------------------------------------------------------------------
struct OutcomeRatio {
    size_t outcome = 0;
    double ratio = 0.0;
};

namespace detail {

inline double likelihood_ratio(double null_p, double alt_p) {
    if (null_p > 0.0) return alt_p / null_p;
    if (alt_p > 0.0) return std::numeric_limits<double>::infinity();
    return std::numeric_limits<double>::quiet_NaN();
}

// Strict descending order on ratios with NaN after everything else.
inline bool ranks_before(double a, double b) {
    if (std::isnan(a)) return false;
    if (std::isnan(b)) return true;
    return a > b;
}

// Relative-epsilon equality. +inf only ties +inf, NaN only ties NaN.
inline bool ratios_tie(double a, double b, double rel_tol) {
    if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
    if (std::isinf(a) || std::isinf(b)) return a == b;
    return std::abs(a - b) <= rel_tol * std::max(std::abs(a), std::abs(b));
}

}  // namespace detail

// ---------------------------------------------------------------------------
// LikelihoodRatioClassifier: identifies likelihood-ratio tests
//
// Outcomes are sorted by decreasing ratio and grouped into ties; a group
// starts a new tie-group as soon as its ratio no longer ties the first
// ratio of the current group. The prefix regions are
//   (), G1, G1+G2, ..., G1+...+Gk = full space
// and a region is an LRT iff it is one of them. Tie-groups enter or leave
// the region as a whole, so matching is by set equality, not by a
// per-outcome threshold test.
// ---------------------------------------------------------------------------
class LikelihoodRatioClassifier {
public:
    explicit LikelihoodRatioClassifier(const DistributionPair& pair,
                                       const AnalysisConfig& config = {})
        : n_(pair.outcome_count()), config_(config) {
        ordered_.reserve(n_);
        for (size_t x = 0; x < n_; ++x) {
            ordered_.push_back({x, detail::likelihood_ratio(pair.null_at(x), pair.alt_at(x))});
        }
        std::stable_sort(ordered_.begin(), ordered_.end(),
                         [](const OutcomeRatio& a, const OutcomeRatio& b) {
                             return detail::ranks_before(a.ratio, b.ratio);
                         });

        double anchor = 0.0;
        for (const auto& o : ordered_) {
            if (groups_.empty() || !detail::ratios_tie(anchor, o.ratio, config.ratio_tolerance)) {
                groups_.emplace_back();
                anchor = o.ratio;
            }
            groups_.back().push_back(o.outcome);
        }
        for (auto& group : groups_) {
            std::sort(group.begin(), group.end());
        }

        std::vector<size_t> cumulative;
        prefixes_.emplace_back();
        for (const auto& group : groups_) {
            cumulative.insert(cumulative.end(), group.begin(), group.end());
            prefixes_.emplace_back(cumulative);
        }
        prefix_set_.insert(prefixes_.begin(), prefixes_.end());
    }

    // Outcomes with their ratios, highest ratio first.
    const std::vector<OutcomeRatio>& ordered_ratios() const { return ordered_; }

    const std::vector<std::vector<size_t>>& tie_groups() const { return groups_; }

    // (), then one region per tie-group added; tie_groups().size() + 1 entries.
    const std::vector<Region>& prefix_regions() const { return prefixes_; }

    bool is_lrt(const Region& region) const { return prefix_set_.count(region) > 0; }

    // LRT flag for every region of the outcome space.
    std::map<Region, bool> classify() const {
        detail::check_table_outcomes(static_cast<long long>(n_), config_);
        std::map<Region, bool> flags;
        for (Region r : RegionEnumerator(static_cast<int>(n_))) {
            bool lrt = is_lrt(r);
            flags.emplace(std::move(r), lrt);
        }
        return flags;
    }

private:
    size_t n_ = 0;
    AnalysisConfig config_;
    std::vector<OutcomeRatio> ordered_;
    std::vector<std::vector<size_t>> groups_;
    std::vector<Region> prefixes_;
    std::set<Region> prefix_set_;
};

inline std::map<Region, bool> classify_lrt(const DistributionPair& pair,
                                           const AnalysisConfig& config = {}) {
    return LikelihoodRatioClassifier(pair, config).classify();
}
