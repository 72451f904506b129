// region_selector_test.cpp: most powerful LRT region within a size budget

#include <gtest/gtest.h>

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/errors.hpp"
#include "analysis/likelihood_ratio.hpp"
#include "analysis/region.hpp"
#include "analysis/region_evaluator.hpp"
#include "analysis/region_selector.hpp"
#include "test_helpers.hpp"

#include <cstdint>
#include <limits>
#include <vector>

using test_helpers::make_positive_pair;
using test_helpers::tulip_pair;

class RegionSelectorTest : public ::testing::Test {
protected:
    RegionSelector selector;
    RegionEvaluator evaluator;
};

TEST_F(RegionSelectorTest, TulipBudgetFifteenPercent) {
    auto pair = tulip_pair();
    Region r = selector.select(pair, 0.15);
    EXPECT_EQ(r, (Region{0, 1, 2}));
    auto s = evaluator.evaluate(r, pair);
    EXPECT_NEAR(s.size, 0.104, 1e-12);
    EXPECT_NEAR(s.power, 0.837, 1e-12);
}

TEST_F(RegionSelectorTest, TulipSmallBudgets) {
    auto pair = tulip_pair();
    EXPECT_EQ(selector.select(pair, 0.0), Region{});
    EXPECT_EQ(selector.select(pair, 0.001), Region{0});
    EXPECT_EQ(selector.select(pair, 0.05), (Region{0, 1}));
}

TEST_F(RegionSelectorTest, GenerousBudgetSelectsFullRegion) {
    auto pair = tulip_pair();
    EXPECT_EQ(selector.select(pair, 2.0), Region::full(6));
}

TEST_F(RegionSelectorTest, NegativeBudgetRejected) {
    EXPECT_THROW(selector.select(tulip_pair(), -0.01), InvalidBudgetError);
    EXPECT_THROW(selector.select_brute_force(tulip_pair(), -1.0), InvalidBudgetError);
}

TEST_F(RegionSelectorTest, NanBudgetRejected) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(selector.select(tulip_pair(), nan), InvalidBudgetError);
}

TEST_F(RegionSelectorTest, EqualPowerPrefersSmallerSize) {
    // ratios 1.2, 1.33, 0: prefixes (), (1), (0 1), (0 1 2)
    // (0 1) and (0 1 2) both have power 1; (0 1) has size 0.8.
    DistributionPair pair({0.5, 0.3, 0.2}, {0.6, 0.4, 0.0});
    Region r = selector.select(pair, 1.0);
    EXPECT_EQ(r, (Region{0, 1}));
}

TEST_F(RegionSelectorTest, SelectionIsAnLrtWithinBudgetAndMaximalPower) {
    const std::vector<double> budgets = {0.0, 0.05, 0.1, 0.2, 0.35, 0.5, 0.8, 1.0};
    for (uint32_t seed = 1; seed <= 6; ++seed) {
        auto pair = make_positive_pair(6, seed);
        LikelihoodRatioClassifier classifier(pair);
        for (double budget : budgets) {
            Region r = selector.select(pair, budget);
            auto s = evaluator.evaluate(r, pair);
            EXPECT_TRUE(classifier.is_lrt(r));
            EXPECT_LE(s.size, budget);
            for (const auto& other : classifier.prefix_regions()) {
                auto o = evaluator.evaluate(other, pair);
                if (o.size <= budget) {
                    EXPECT_GE(s.power, o.power)
                        << "seed=" << seed << " budget=" << budget
                        << " selected=" << r.to_string() << " other=" << other.to_string();
                }
            }
        }
    }
}

TEST_F(RegionSelectorTest, BruteForceAgreesAtPrefixSizes) {
    for (uint32_t seed = 1; seed <= 4; ++seed) {
        auto pair = make_positive_pair(6, seed);
        LikelihoodRatioClassifier classifier(pair);
        for (const auto& prefix : classifier.prefix_regions()) {
            double budget = evaluator.evaluate(prefix, pair).size;
            Region lrt = selector.select(pair, budget);
            Region brute = selector.select_brute_force(pair, budget);
            EXPECT_EQ(lrt, prefix);
            EXPECT_NEAR(evaluator.evaluate(lrt, pair).power,
                        evaluator.evaluate(brute, pair).power, 1e-12)
                << "seed=" << seed << " prefix=" << prefix.to_string();
        }
    }
}

TEST_F(RegionSelectorTest, BruteForceNeverLosesToLrtSelection) {
    auto pair = make_positive_pair(5, 11u);
    for (double budget : {0.0, 0.1, 0.25, 0.5, 0.75, 1.0}) {
        auto lrt = evaluator.evaluate(selector.select(pair, budget), pair);
        auto brute = evaluator.evaluate(selector.select_brute_force(pair, budget), pair);
        EXPECT_LE(brute.size, budget);
        EXPECT_GE(brute.power, lrt.power);
    }
}

TEST_F(RegionSelectorTest, BruteForceRejectsOutcomeCountAboveLimit) {
    AnalysisConfig config;
    auto pair = make_positive_pair(config.max_outcomes + 1, 23u);
    RegionSelector limited(config);
    EXPECT_THROW(limited.select_brute_force(pair, 0.5), InvalidInputError);

    // The LRT search only walks the prefix regions and is not capped.
    Region r = limited.select(pair, 0.5);
    EXPECT_LE(evaluator.evaluate(r, pair).size, 0.5);
}
