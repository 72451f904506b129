#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/errors.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DistributionPair: null and alternative probability mass functions over
// the outcome space {0, ..., n-1}
//
// n is the length of the null list. A shorter alternative list is padded
// with zero probability; padded_outcomes() reports how many were added.
// ---------------------------------------------------------------------------
class DistributionPair {
public:
    DistributionPair(std::vector<double> null_probs,
                     std::vector<double> alt_probs,
                     const AnalysisConfig& config = {})
        : null_(std::move(null_probs)), alt_(std::move(alt_probs)) {
        if (null_.empty()) {
            throw InvalidInputError("null distribution must cover at least one outcome");
        }
        if (alt_.size() > null_.size()) {
            throw InvalidInputError("domain mismatch: alternative has " +
                                    std::to_string(alt_.size()) + " outcomes, null has " +
                                    std::to_string(null_.size()));
        }
        padded_ = null_.size() - alt_.size();
        alt_.resize(null_.size(), 0.0);

        validate(null_, "null", config.sum_tolerance);
        validate(alt_, "alternative", config.sum_tolerance);
    }

    const std::vector<double>& null_probs() const { return null_; }
    const std::vector<double>& alt_probs() const { return alt_; }

    double null_at(size_t outcome) const { return null_.at(outcome); }
    double alt_at(size_t outcome) const { return alt_.at(outcome); }

    size_t outcome_count() const { return null_.size(); }
    size_t padded_outcomes() const { return padded_; }

private:
    static void validate(const std::vector<double>& probs, const std::string& name,
                         double sum_tolerance) {
        double sum = 0.0;
        for (size_t i = 0; i < probs.size(); ++i) {
            double p = probs[i];
            if (!std::isfinite(p) || p < 0.0) {
                throw InvalidInputError(name + " probability at outcome " +
                                        std::to_string(i) + " must be finite and non-negative");
            }
            sum += p;
        }
        if (std::abs(sum - 1.0) > sum_tolerance) {
            throw InvalidInputError(name + " probabilities sum to " + std::to_string(sum) +
                                    ", expected 1");
        }
    }

    std::vector<double> null_;
    std::vector<double> alt_;
    size_t padded_ = 0;
};
