#include "stats/kernel_density.h"

#include "stats/descriptive.h"

#include <cmath>
#include <utility>

namespace stats {

namespace {
constexpr double kSqrtTwoPi = 2.50662827463100050242;
}

std::optional<GaussianKDE> GaussianKDE::fit(std::vector<double> const& sample) {
    if (sample.size() < 2 || !allFinite(sample)) {
        return std::nullopt;
    }

    double const n = static_cast<double>(sample.size());
    double const s = std::sqrt(sampleVariance(sample));
    double const h = s * std::pow(n, -0.2);

    if (!std::isfinite(h) || h <= 0.0) {
        return std::nullopt;
    }
    return GaussianKDE(sample, h);
}

GaussianKDE::GaussianKDE(std::vector<double> sample, double bandwidth)
    : sample_(std::move(sample)), bandwidth_(bandwidth) {
    norm_ = 1.0 / (static_cast<double>(sample_.size()) * bandwidth_ * kSqrtTwoPi);
}

double GaussianKDE::operator()(double x) const {
    double const inv_h = 1.0 / bandwidth_;
    double sum = 0.0;
    for (double xi : sample_) {
        double u = (x - xi) * inv_h;
        sum += std::exp(-0.5 * u * u);
    }
    return sum * norm_;
}

std::vector<double> GaussianKDE::evaluate(std::vector<double> const& points) const {
    std::vector<double> density;
    density.reserve(points.size());
    for (double x : points) {
        density.push_back((*this)(x));
    }
    return density;
}

std::optional<double> densityPeak(std::vector<double> const& sample, int grid_points) {
    auto kde = GaussianKDE::fit(sample);
    if (!kde) {
        return std::nullopt;
    }

    auto grid = linspace(min(sample), max(sample), grid_points);
    if (grid.empty()) {
        return std::nullopt;
    }

    // First maximum wins on ties
    size_t best = 0;
    double best_density = (*kde)(grid[0]);
    for (size_t i = 1; i < grid.size(); ++i) {
        double d = (*kde)(grid[i]);
        if (d > best_density) {
            best_density = d;
            best = i;
        }
    }
    return grid[best];
}

} // namespace stats
