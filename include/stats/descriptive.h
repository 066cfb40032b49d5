#pragma once

#include <vector>

// Cross-sectional descriptive statistics over one sample.
// Empty samples return 0.0. NaN propagates (median/percentile of a sample
// containing NaN is NaN); infinities are ordered normally.
namespace stats {

double mean(std::vector<double> const& values);

// Population variance (divides by n)
double variance(std::vector<double> const& values);
double stddev(std::vector<double> const& values);

// Sample variance (divides by n-1), 0.0 when n < 2
double sampleVariance(std::vector<double> const& values);

double median(std::vector<double> const& values);

// Linear interpolation between closest ranks, p in [0,100]
double percentile(std::vector<double> const& values, double p);

// Same as percentile() but on an already sorted, NaN-free sample
double percentileSorted(std::vector<double> const& sorted, double p);

double min(std::vector<double> const& values);
double max(std::vector<double> const& values);

bool allFinite(std::vector<double> const& values);

// n evenly spaced points covering [lo, hi] inclusive (n == 1 gives {lo})
std::vector<double> linspace(double lo, double hi, int n);

} // namespace stats
