#include "simulation.h"

#include <chrono>

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double>;

SimulationRequest SimulationRequest::fromConfig(Config const& config) {
    SimulationRequest request;
    request.truth = config.truth;
    request.model = config.model;
    request.steps = config.simulation.steps;
    request.error_threshold = config.simulation.error_threshold;
    request.ensemble_enabled = config.ensemble.enabled;
    request.ensemble_size = config.ensemble.size;
    request.init_perturbation_sd = config.ensemble.init_perturbation_sd;
    request.param_perturbation_sd = config.ensemble.param_perturbation_sd;
    request.statistic = config.ensemble.statistic;
    request.track_mode = config.ensemble.track_mode;
    return request;
}

SimulationResults runSimulation(SimulationRequest const& request, RandomEngine& rng) {
    auto start = Clock::now();

    SimulationResults results;
    results.truth = runTrajectory(request.truth.x0, request.truth.r, request.steps);
    results.model_det = runTrajectory(request.model.x0, request.model.r, request.steps);

    if (request.ensemble_enabled) {
        auto ensemble_start = Clock::now();

        EnsembleParams params;
        params.x0_model = request.model.x0;
        params.r_model = request.model.r;
        params.steps = request.steps;
        params.member_count = request.ensemble_size;
        params.init_perturbation_sd = request.init_perturbation_sd;
        params.param_perturbation_sd = request.param_perturbation_sd;
        params.track_mode = request.track_mode || request.statistic == StatisticKind::Mode;

        results.ensemble = runEnsemble(params, rng);
        results.error_bounds =
            predictability::computeErrorBounds(results.ensemble->matrix, results.truth);

        results.timing.ensemble_seconds = Duration(Clock::now() - ensemble_start).count();
    }

    reselect(results, request.statistic, request.error_threshold);

    results.timing.total_seconds = Duration(Clock::now() - start).count();
    return results;
}

void reselect(SimulationResults& results, StatisticKind statistic, double threshold) {
    results.statistic = statistic;
    results.threshold = threshold;

    if (results.ensemble) {
        if (statistic == StatisticKind::Mode) {
            results.ensemble->ensureModeSeries();
        }
        results.selected = selectSeries(results.ensemble->statistics, statistic);
    } else {
        results.selected = results.model_det;
    }

    results.prediction = predictability::analyze(results.truth, results.selected, threshold);
}
