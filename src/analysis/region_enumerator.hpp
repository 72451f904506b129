#pragma once

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/errors.hpp"
#include "analysis/region.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

// Regions are generated from a 64-bit indicator mask.
constexpr int MAX_REGION_OUTCOMES = 63;

namespace detail {

// Whole-table analyses touch all 2^n regions; refuse n above the configured cap.
inline void check_table_outcomes(long long n, const AnalysisConfig& config) {
    if (n < 0) {
        throw InvalidInputError("outcome count must be non-negative, got " + std::to_string(n));
    }
    if (config.max_outcomes < 0 || n > config.max_outcomes) {
        throw InvalidInputError("outcome count " + std::to_string(n) +
                                " exceeds max_outcomes=" + std::to_string(config.max_outcomes));
    }
}

}  // namespace detail

// ---------------------------------------------------------------------------
// RegionEnumerator: lazy power set of {0, ..., n-1}
//
// Regions come out in ascending indicator-mask order: (), (0), (1), (0 1),
// (2), ... The sequence is restartable; each begin() starts from ().
// ---------------------------------------------------------------------------
class RegionEnumerator {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Region;
        using difference_type = std::ptrdiff_t;
        using reference = Region;

        Iterator() = default;
        explicit Iterator(uint64_t mask) : mask_(mask) {}

        Region operator*() const { return Region::from_mask(mask_); }
        uint64_t mask() const { return mask_; }

        Iterator& operator++() {
            ++mask_;
            return *this;
        }
        Iterator operator++(int) {
            Iterator prev = *this;
            ++mask_;
            return prev;
        }

        friend bool operator==(const Iterator& a, const Iterator& b) { return a.mask_ == b.mask_; }
        friend bool operator!=(const Iterator& a, const Iterator& b) { return !(a == b); }

    private:
        uint64_t mask_ = 0;
    };

    explicit RegionEnumerator(int n) : n_(n) {
        if (n < 0) {
            throw InvalidInputError("outcome count must be non-negative, got " + std::to_string(n));
        }
        if (n > MAX_REGION_OUTCOMES) {
            throw InvalidInputError("outcome count " + std::to_string(n) +
                                    " exceeds the enumerable limit of " +
                                    std::to_string(MAX_REGION_OUTCOMES));
        }
    }

    explicit RegionEnumerator(const DistributionPair& pair)
        : RegionEnumerator(checked_count(pair.outcome_count())) {}

    Iterator begin() const { return Iterator(0); }
    Iterator end() const { return Iterator(region_count()); }

    int outcome_count() const { return n_; }
    uint64_t region_count() const { return uint64_t{1} << n_; }

private:
    static int checked_count(size_t n) {
        if (n > static_cast<size_t>(MAX_REGION_OUTCOMES)) {
            throw InvalidInputError("outcome count " + std::to_string(n) +
                                    " exceeds the enumerable limit of " +
                                    std::to_string(MAX_REGION_OUTCOMES));
        }
        return static_cast<int>(n);
    }

    int n_ = 0;
};

// Materialized power set, in RegionEnumerator order.
inline std::vector<Region> enumerate_regions(int n, const AnalysisConfig& config = {}) {
    detail::check_table_outcomes(n, config);
    RegionEnumerator regions(n);
    std::vector<Region> out;
    out.reserve(static_cast<size_t>(regions.region_count()));
    for (Region r : regions) {
        out.push_back(std::move(r));
    }
    return out;
}
