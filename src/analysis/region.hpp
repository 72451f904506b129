#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Region: a rejection region, i.e. the set of outcomes on which the null
// hypothesis is rejected
//
// Canonical form is the ascending sequence of distinct outcome indices.
// Regions compare lexicographically over that sequence.
// ---------------------------------------------------------------------------
class Region {
public:
    Region() = default;

    Region(std::initializer_list<size_t> outcomes)
        : Region(std::vector<size_t>(outcomes)) {}

    explicit Region(std::vector<size_t> outcomes) : outcomes_(std::move(outcomes)) {
        std::sort(outcomes_.begin(), outcomes_.end());
        outcomes_.erase(std::unique(outcomes_.begin(), outcomes_.end()), outcomes_.end());
    }

    // Bit i of mask set <=> outcome i in the region.
    static Region from_mask(uint64_t mask) {
        Region r;
        for (size_t i = 0; mask != 0; ++i, mask >>= 1) {
            if (mask & 1u) r.outcomes_.push_back(i);
        }
        return r;
    }

    // {0, ..., n-1}
    static Region full(size_t n) {
        Region r;
        r.outcomes_.resize(n);
        std::iota(r.outcomes_.begin(), r.outcomes_.end(), size_t{0});
        return r;
    }

    const std::vector<size_t>& outcomes() const { return outcomes_; }
    size_t cardinality() const { return outcomes_.size(); }
    bool empty() const { return outcomes_.empty(); }

    bool contains(size_t outcome) const {
        return std::binary_search(outcomes_.begin(), outcomes_.end(), outcome);
    }

    bool is_subset_of(const Region& other) const {
        return std::includes(other.outcomes_.begin(), other.outcomes_.end(),
                             outcomes_.begin(), outcomes_.end());
    }

    // "(0 1 2)", "()" for the empty region.
    std::string to_string() const {
        std::ostringstream ss;
        ss << "(";
        for (size_t i = 0; i < outcomes_.size(); ++i) {
            if (i > 0) ss << " ";
            ss << outcomes_[i];
        }
        ss << ")";
        return ss.str();
    }

    friend bool operator==(const Region& a, const Region& b) { return a.outcomes_ == b.outcomes_; }
    friend bool operator!=(const Region& a, const Region& b) { return !(a == b); }
    friend bool operator<(const Region& a, const Region& b) { return a.outcomes_ < b.outcomes_; }

private:
    std::vector<size_t> outcomes_;
};

// ---------------------------------------------------------------------------
// RegionStats: size (null probability) and power (alternative probability)
// ---------------------------------------------------------------------------
struct RegionStats {
    double size = 0.0;
    double power = 0.0;
};

struct EvaluatedRegion {
    Region region;
    RegionStats stats;
};
