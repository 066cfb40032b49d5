#pragma once

#include "statistic_kind.h"

#include <vector>

namespace stats {

// Which branch produced a mode estimate
enum class ModeSource {
    Density,            // peak of the kernel density estimate
    DegenerateVariance, // population sd below kDegenerateStd, mode = mean
    DensityFailure      // density estimate could not be built, mode = median
};

// Below this population standard deviation the sample is treated as a point mass
inline constexpr double kDegenerateStd = 1e-9;
inline constexpr int kModeGridPoints = 200;

struct ModeEstimate {
    double value = 0.0;
    ModeSource source = ModeSource::Density;
};

struct CentralTendency {
    double mean = 0.0;
    double median = 0.0;
    double mode = 0.0;
    ModeSource mode_source = ModeSource::Density;

    double get(StatisticKind kind) const {
        switch (kind) {
        case StatisticKind::Mean:
            return mean;
        case StatisticKind::Median:
            return median;
        case StatisticKind::Mode:
            return mode;
        }
        return mean;
    }
};

// Density-based mode with the degenerate-variance and estimation-failure fallbacks
ModeEstimate estimateMode(std::vector<double> const& sample);

// Mean, median and density-based mode of one cross-sectional sample
CentralTendency estimate(std::vector<double> const& sample);

} // namespace stats
