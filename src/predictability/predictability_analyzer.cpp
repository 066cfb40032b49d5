#include "predictability/predictability_analyzer.h"

#include "stats/descriptive.h"

#include <algorithm>
#include <cmath>

namespace predictability {

int firstCrossing(std::vector<double> const& series, double threshold) {
    for (size_t i = 0; i < series.size(); ++i) {
        if (series[i] > threshold) {
            return static_cast<int>(i);
        }
    }
    return static_cast<int>(series.size());
}

PredictabilityResult analyze(Trajectory const& truth, Trajectory const& model_stat,
                             double threshold) {
    PredictabilityResult result;
    result.abs_error = absoluteDifference(model_stat, truth);
    result.index = firstCrossing(result.abs_error, threshold);
    return result;
}

ErrorBounds computeErrorBounds(EnsembleMatrix const& matrix, Trajectory const& truth) {
    int const steps = std::min(matrix.steps(), static_cast<int>(truth.size()));
    int const members = matrix.members();

    ErrorBounds bounds;
    bounds.p10.resize(steps);
    bounds.p90.resize(steps);
    bounds.min.resize(steps);
    bounds.max.resize(steps);

    std::vector<double> diffs(members);
    for (int t = 0; t < steps; ++t) {
        for (int m = 0; m < members; ++m) {
            diffs[m] = std::abs(matrix.at(m, t) - truth[t]);
        }
        bounds.p10[t] = stats::percentile(diffs, 10.0);
        bounds.p90[t] = stats::percentile(diffs, 90.0);
        bounds.min[t] = stats::min(diffs);
        bounds.max[t] = stats::max(diffs);
    }
    return bounds;
}

std::vector<double> clipBelow(std::vector<double> values, double floor) {
    for (double& v : values) {
        v = std::max(v, floor);
    }
    return values;
}

ErrorBounds ErrorBounds::clippedForLog() const {
    ErrorBounds out;
    out.p10 = clipBelow(p10);
    out.p90 = clipBelow(p90);
    out.min = clipBelow(min);
    out.max = clipBelow(max);
    return out;
}

} // namespace predictability
