#pragma once

#include "random_stream.h"
#include "statistic_kind.h"

#include <vector>

namespace predictability {

// Initial states are clipped to [kStateClip, 1 - kStateClip] so no trial starts
// on the boundary fixed points
inline constexpr double kStateClip = 1e-10;

// The model's own initial uncertainty is assumed 10x smaller than the truth's
inline constexpr double kModelIcScale = 0.1;

struct LimitScanParams {
    double r = 3.7;
    double model_bias = 0.0;
    double ic_bias = 1e-10;
    int ensemble_size = 50; // independent trials
    int iterations = 90;
    double threshold = 0.1;
    // Mode is answered with the median curve. The published lookup table was
    // generated with that definition, so it is kept as-is.
    StatisticKind metric = StatisticKind::Median;
};

// r biased by model_bias, left unchanged when r == 0
double biasedParameter(double r, double model_bias);

// Per-step aggregate of |x_model - x_truth| over all trials
std::vector<double> limitScanErrorCurve(LimitScanParams const& params, RandomEngine& rng);

// First step where the aggregate error exceeds the threshold, or
// params.iterations when it never does
int singleScenarioPredictabilityLimit(LimitScanParams const& params, RandomEngine& rng);

} // namespace predictability
