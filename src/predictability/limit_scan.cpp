#include "predictability/limit_scan.h"

#include "logistic_map.h"
#include "predictability/predictability_analyzer.h"
#include "stats/descriptive.h"

#include <algorithm>
#include <cmath>

namespace predictability {

double biasedParameter(double r, double model_bias) {
    if (r == 0.0) {
        return r;
    }
    return r * (1.0 + model_bias / r);
}

std::vector<double> limitScanErrorCurve(LimitScanParams const& params, RandomEngine& rng) {
    int const trials = std::max(0, params.ensemble_size);
    int const iterations = std::max(0, params.iterations);
    double const r_model = biasedParameter(params.r, params.model_bias);

    // diffs[t][trial]
    std::vector<std::vector<double>> diffs(iterations, std::vector<double>(trials));

    for (int m = 0; m < trials; ++m) {
        // Fresh base state per trial so the limit is averaged over the attractor
        double const x0_base = uniform(rng, 0.1, 0.9);
        double x_truth = x0_base + standardNormal(rng) * params.ic_bias;
        double x_model = x0_base + standardNormal(rng) * params.ic_bias * kModelIcScale;
        x_truth = std::clamp(x_truth, kStateClip, 1.0 - kStateClip);
        x_model = std::clamp(x_model, kStateClip, 1.0 - kStateClip);

        for (int t = 0; t < iterations; ++t) {
            diffs[t][m] = std::abs(x_model - x_truth);
            x_truth = logistic::step(x_truth, params.r);
            x_model = logistic::step(x_model, r_model);
        }
    }

    std::vector<double> curve(iterations);
    for (int t = 0; t < iterations; ++t) {
        switch (params.metric) {
        case StatisticKind::Mean:
            curve[t] = stats::mean(diffs[t]);
            break;
        case StatisticKind::Median:
        case StatisticKind::Mode:
            curve[t] = stats::median(diffs[t]);
            break;
        }
    }
    return curve;
}

int singleScenarioPredictabilityLimit(LimitScanParams const& params, RandomEngine& rng) {
    return firstCrossing(limitScanErrorCurve(params, rng), params.threshold);
}

} // namespace predictability
