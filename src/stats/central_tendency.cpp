#include "stats/central_tendency.h"

#include "stats/descriptive.h"
#include "stats/kernel_density.h"

namespace stats {

ModeEstimate estimateMode(std::vector<double> const& sample) {
    ModeEstimate result;

    if (stddev(sample) < kDegenerateStd) {
        result.value = mean(sample);
        result.source = ModeSource::DegenerateVariance;
        return result;
    }

    auto peak = densityPeak(sample, kModeGridPoints);
    if (!peak) {
        result.value = median(sample);
        result.source = ModeSource::DensityFailure;
        return result;
    }

    result.value = *peak;
    result.source = ModeSource::Density;
    return result;
}

CentralTendency estimate(std::vector<double> const& sample) {
    CentralTendency ct;
    ct.mean = mean(sample);
    ct.median = median(sample);

    ModeEstimate mode = estimateMode(sample);
    ct.mode = mode.value;
    ct.mode_source = mode.source;
    return ct;
}

} // namespace stats
