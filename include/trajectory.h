#pragma once

#include <vector>

using Trajectory = std::vector<double>;

// Single deterministic trajectory of `steps` values. Index 0 holds x0; the
// state is recorded before each application of the map, so the last value is
// the state after steps-1 applications.
Trajectory runTrajectory(double x0, double r, int steps);

// Element-wise |a[t] - b[t]| over the common length
std::vector<double> absoluteDifference(std::vector<double> const& a, std::vector<double> const& b);
