#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace stats {

// One-dimensional Gaussian kernel density estimate with Scott's bandwidth
// h = s * n^(-1/5), s = sample standard deviation (n-1 denominator).
class GaussianKDE {
public:
    // Returns nullopt when the estimate cannot be built: fewer than two
    // points, non-finite samples, or a bandwidth that is not positive/finite.
    static std::optional<GaussianKDE> fit(std::vector<double> const& sample);

    double operator()(double x) const;
    std::vector<double> evaluate(std::vector<double> const& points) const;

    double bandwidth() const { return bandwidth_; }
    size_t size() const { return sample_.size(); }

private:
    GaussianKDE(std::vector<double> sample, double bandwidth);

    std::vector<double> sample_;
    double bandwidth_ = 0.0;
    double norm_ = 0.0; // 1 / (n * h * sqrt(2*pi))
};

// Location of maximum density on `grid_points` evenly spaced points over
// [min(sample), max(sample)]. nullopt when the estimate cannot be built.
std::optional<double> densityPeak(std::vector<double> const& sample, int grid_points = 200);

} // namespace stats
