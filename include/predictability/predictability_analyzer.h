#pragma once

#include "ensemble_engine.h"
#include "trajectory.h"

#include <cstddef>
#include <functional>
#include <vector>

namespace predictability {

// Progress callback: (completed, total)
using ProgressCallback = std::function<void(int, int)>;

// Floor applied to error bounds before they are shown on a log axis
inline constexpr double kLogFloor = 1e-16;

struct PredictabilityResult {
    // First step with abs_error > threshold, or abs_error.size() if none
    int index = 0;
    std::vector<double> abs_error;

    bool exceeded() const { return index < static_cast<int>(abs_error.size()); }
};

// First index t with series[t] > threshold; series.size() when never exceeded
int firstCrossing(std::vector<double> const& series, double threshold);

PredictabilityResult analyze(Trajectory const& truth, Trajectory const& model_stat,
                             double threshold);

// Per-step spread of |member - truth| across the ensemble
struct ErrorBounds {
    std::vector<double> p10;
    std::vector<double> p90;
    std::vector<double> min;
    std::vector<double> max;

    // Copy with every value floored at kLogFloor
    ErrorBounds clippedForLog() const;
    size_t size() const { return p10.size(); }
};

ErrorBounds computeErrorBounds(EnsembleMatrix const& matrix, Trajectory const& truth);

std::vector<double> clipBelow(std::vector<double> values, double floor = kLogFloor);

} // namespace predictability
