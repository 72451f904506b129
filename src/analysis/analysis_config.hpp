#pragma once

// ---------------------------------------------------------------------------
// AnalysisConfig: tolerances and limits shared by the region analyses
// ---------------------------------------------------------------------------
struct AnalysisConfig {
    // Accepted |sum(p) - 1| per distribution. Three-decimal probability
    // tables drift by up to n * 0.0005.
    double sum_tolerance = 0.01;

    // Relative tolerance under which two likelihood ratios form one tie-group.
    double ratio_tolerance = 1e-9;

    // Largest outcome space accepted by whole-table analyses (O(4^n) dominance).
    int max_outcomes = 20;
};
