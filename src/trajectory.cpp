#include "trajectory.h"

#include "logistic_map.h"

#include <algorithm>
#include <cmath>

Trajectory runTrajectory(double x0, double r, int steps) {
    Trajectory out;
    if (steps <= 0) {
        return out;
    }
    out.reserve(steps);

    double x = x0;
    for (int t = 0; t < steps; ++t) {
        out.push_back(x);
        x = logistic::step(x, r);
    }
    return out;
}

std::vector<double> absoluteDifference(std::vector<double> const& a, std::vector<double> const& b) {
    size_t const n = std::min(a.size(), b.size());
    std::vector<double> diff(n);
    for (size_t i = 0; i < n; ++i) {
        diff[i] = std::abs(a[i] - b[i]);
    }
    return diff;
}
