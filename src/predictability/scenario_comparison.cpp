#include "predictability/scenario_comparison.h"

#include "predictability/predictability_analyzer.h"
#include "simulation.h"
#include "stats/descriptive.h"

#include <algorithm>
#include <chrono>

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double>;

namespace predictability {

namespace {

void accumulate(std::vector<double>& sum, std::vector<double> const& values) {
    size_t const n = std::min(sum.size(), values.size());
    for (size_t t = 0; t < n; ++t) {
        sum[t] += values[t];
    }
}

void divide(std::vector<double>& values, double denom) {
    for (double& v : values) {
        v /= denom;
    }
}

} // namespace

ComparisonResult compareScenarios(ComparisonParams const& params, RandomEngine& rng,
                                  ProgressCallback progress) {
    auto start = Clock::now();

    ComparisonResult result;
    result.ic_values = stats::linspace(params.ic_min, params.ic_max, params.ic_count);
    if (params.scenarios.empty() || result.ic_values.empty()) {
        return result;
    }

    size_t const steps = static_cast<size_t>(std::max(0, params.steps));
    int const total = static_cast<int>(params.scenarios.size() * result.ic_values.size());
    int completed = 0;

    for (ScenarioSpec const& scenario : params.scenarios) {
        ScenarioCurve curve;
        curve.scenario = scenario;
        curve.error.assign(steps, 0.0);
        curve.error_p10.assign(steps, 0.0);
        curve.error_p90.assign(steps, 0.0);

        for (double ic : result.ic_values) {
            SimulationRequest request;
            request.truth = {params.r, ic};
            request.model = {params.r + scenario.model_bias, ic + scenario.ic_bias};
            request.steps = params.steps;
            request.error_threshold = params.threshold;
            request.ensemble_enabled = true;
            request.ensemble_size = params.ensemble_size;
            request.init_perturbation_sd = scenario.ic_bias;
            request.param_perturbation_sd = 0.0;
            request.statistic = params.statistic;
            request.track_mode = params.statistic == StatisticKind::Mode;

            SimulationResults run = runSimulation(request, rng);
            accumulate(curve.error, run.prediction.abs_error);
            accumulate(curve.error_p10, run.error_bounds->p10);
            accumulate(curve.error_p90, run.error_bounds->p90);

            if (progress) {
                progress(++completed, total);
            }
        }

        double const n = static_cast<double>(result.ic_values.size());
        divide(curve.error, n);
        divide(curve.error_p10, n);
        divide(curve.error_p90, n);
        curve.index = firstCrossing(curve.error, params.threshold);
        result.curves.push_back(std::move(curve));
    }

    std::vector<double> const reference = clipBelow(result.curves.front().error);

    for (ScenarioCurve& curve : result.curves) {
        curve.normalized.resize(steps);
        for (size_t t = 0; t < steps; ++t) {
            curve.normalized[t] = curve.error[t] / reference[t];
        }
    }

    result.normalized_threshold.resize(steps);
    for (size_t t = 0; t < steps; ++t) {
        result.normalized_threshold[t] = params.threshold / reference[t];
    }

    result.computation_seconds = Duration(Clock::now() - start).count();
    return result;
}

} // namespace predictability
