#pragma once

#include "predictability/predictability_analyzer.h"
#include "random_stream.h"
#include "statistic_kind.h"

#include <vector>

namespace predictability {

struct ScenarioSpec {
    double ic_bias = 1e-6;
    double model_bias = 1e-6;
};

// Error growth of several (ic_bias, model_bias) scenarios at one reference r,
// each averaged over a spread of starting points. scenarios[0] is the reference.
struct ComparisonParams {
    double r = 3.7;
    double ic_min = 0.2;
    double ic_max = 0.8;
    int ic_count = 5;
    int ensemble_size = 25;
    double threshold = 0.1;
    int steps = 50;
    StatisticKind statistic = StatisticKind::Median;
    std::vector<ScenarioSpec> scenarios = {
        {1e-6, 1e-6}, {1e-6, 2.5e-5}, {1e-6, 7.5e-5}, {5e-5, 7.5e-5}};
};

struct ScenarioCurve {
    ScenarioSpec scenario;

    // Averaged over the starting points
    std::vector<double> error;
    std::vector<double> error_p10;
    std::vector<double> error_p90;

    // error / max(reference error, kLogFloor)
    std::vector<double> normalized;
    int index = 0;
};

struct ComparisonResult {
    std::vector<double> ic_values;
    std::vector<ScenarioCurve> curves;
    std::vector<double> normalized_threshold; // threshold / max(reference error, kLogFloor)
    double computation_seconds = 0.0;
};

// Empty scenarios give an empty result
ComparisonResult compareScenarios(ComparisonParams const& params, RandomEngine& rng,
                                  ProgressCallback progress = nullptr);

} // namespace predictability
