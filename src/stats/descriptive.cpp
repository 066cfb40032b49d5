#include "stats/descriptive.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace stats {

namespace {

bool hasNaN(std::vector<double> const& values) {
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isnan(v); });
}

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

double mean(std::vector<double> const& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double variance(std::vector<double> const& values) {
    if (values.empty()) {
        return 0.0;
    }
    double m = mean(values);
    double var_sum = 0.0;
    for (double v : values) {
        double diff = v - m;
        var_sum += diff * diff;
    }
    return var_sum / static_cast<double>(values.size());
}

double stddev(std::vector<double> const& values) {
    return std::sqrt(variance(values));
}

double sampleVariance(std::vector<double> const& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    return variance(values) * static_cast<double>(values.size()) /
           static_cast<double>(values.size() - 1);
}

double median(std::vector<double> const& values) {
    return percentile(values, 50.0);
}

double percentile(std::vector<double> const& values, double p) {
    if (values.empty()) {
        return 0.0;
    }
    if (hasNaN(values)) {
        return kNaN;
    }
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    return percentileSorted(sorted, p);
}

double percentileSorted(std::vector<double> const& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }

    double idx = (p / 100.0) * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    double frac = idx - static_cast<double>(lower);

    // Avoid inf*0 when the neighbouring rank is infinite
    if (frac == 0.0) {
        return sorted[lower];
    }
    return sorted[lower] * (1.0 - frac) + sorted[upper] * frac;
}

double min(std::vector<double> const& values) {
    if (values.empty()) {
        return 0.0;
    }
    if (hasNaN(values)) {
        return kNaN;
    }
    return *std::min_element(values.begin(), values.end());
}

double max(std::vector<double> const& values) {
    if (values.empty()) {
        return 0.0;
    }
    if (hasNaN(values)) {
        return kNaN;
    }
    return *std::max_element(values.begin(), values.end());
}

bool allFinite(std::vector<double> const& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

std::vector<double> linspace(double lo, double hi, int n) {
    std::vector<double> out;
    if (n <= 0) {
        return out;
    }
    out.reserve(n);
    if (n == 1) {
        out.push_back(lo);
        return out;
    }
    double const step = (hi - lo) / static_cast<double>(n - 1);
    for (int i = 0; i < n - 1; ++i) {
        out.push_back(lo + step * i);
    }
    out.push_back(hi);
    return out;
}

} // namespace stats
