#pragma once

#include "config.h"
#include "ensemble_engine.h"
#include "predictability/predictability_analyzer.h"
#include "random_stream.h"
#include "statistic_kind.h"
#include "trajectory.h"

#include <optional>

// Timing results for profiling
struct TimingStats {
    double total_seconds = 0.0;
    double ensemble_seconds = 0.0; // member stepping + per-step statistics
};

// One truth-vs-model run
struct SimulationRequest {
    StateParams truth;
    StateParams model;
    int steps = 100;
    double error_threshold = 0.1;

    bool ensemble_enabled = false;
    int ensemble_size = 50;
    double init_perturbation_sd = 0.0;
    double param_perturbation_sd = 0.0;
    StatisticKind statistic = StatisticKind::Mean;
    bool track_mode = true;

    static SimulationRequest fromConfig(Config const& config);
};

struct SimulationResults {
    Trajectory truth;
    Trajectory model_det;

    std::optional<EnsembleRun> ensemble;
    std::optional<predictability::ErrorBounds> error_bounds;

    // Series compared against truth: model_det without an ensemble,
    // otherwise the chosen ensemble statistic
    StatisticKind statistic = StatisticKind::Mean;
    double threshold = 0.1;
    Trajectory selected;
    predictability::PredictabilityResult prediction;

    TimingStats timing;

    bool hasEnsemble() const { return ensemble.has_value(); }
};

// Truth and deterministic model trajectories, plus the ensemble when enabled.
// Mode tracking is forced on when the selected statistic is Mode.
SimulationResults runSimulation(SimulationRequest const& request, RandomEngine& rng);

// Switch statistic and/or threshold on stored series without re-simulating.
// Selecting Mode on a run that skipped mode tracking computes the mode series once.
void reselect(SimulationResults& results, StatisticKind statistic, double threshold);
