#include "bifurcation.h"

#include "logistic_map.h"
#include "stats/descriptive.h"

#include <algorithm>
#include <chrono>
#include <iterator>

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double>;

namespace bifurcation {

namespace {

// Bin index for v over ascending edges, -1 if outside [front, back]
int binIndex(std::vector<double> const& edges, double v) {
    if (edges.size() < 2 || !(v >= edges.front() && v <= edges.back())) {
        return -1;
    }
    int const bins = static_cast<int>(edges.size()) - 1;
    if (v == edges.back()) {
        return bins - 1;
    }
    auto it = std::upper_bound(edges.begin(), edges.end(), v);
    int idx = static_cast<int>(std::distance(edges.begin(), it)) - 1;
    return std::clamp(idx, 0, bins - 1);
}

} // namespace

uint64_t DensityGrid::total() const {
    uint64_t sum = 0;
    for (uint64_t c : counts) {
        sum += c;
    }
    return sum;
}

uint64_t DensityGrid::maxCount() const {
    if (counts.empty()) {
        return 0;
    }
    return *std::max_element(counts.begin(), counts.end());
}

BifurcationCloud sweep(SweepParams const& params) {
    auto start = Clock::now();

    BifurcationCloud cloud;
    std::vector<double> const r_grid = stats::linspace(params.r_min, params.r_max, params.r_count);
    std::vector<double> x(r_grid.size(), 0.5);

    for (int i = 0; i < params.iterations_discard; ++i) {
        logistic::stepInPlace(x, r_grid);
    }

    for (int i = 0; i < params.iterations_record; ++i) {
        logistic::stepInPlace(x, r_grid);
        for (size_t k = 0; k < x.size(); ++k) {
            if (x[k] >= params.x_min && x[k] <= params.x_max) {
                cloud.r.push_back(r_grid[k]);
                cloud.x.push_back(x[k]);
            }
        }
    }

    cloud.computation_seconds = Duration(Clock::now() - start).count();
    return cloud;
}

DensityGrid histogram(BifurcationCloud const& cloud, SweepParams const& params, int r_bins,
                      int x_bins) {
    DensityGrid grid;
    grid.r_bins = std::max(0, r_bins);
    grid.x_bins = std::max(0, x_bins);
    grid.r_edges = stats::linspace(params.r_min, params.r_max, grid.r_bins + 1);
    grid.x_edges = stats::linspace(params.x_min, params.x_max, grid.x_bins + 1);
    grid.counts.assign(static_cast<size_t>(grid.r_bins) * grid.x_bins, 0);

    if (grid.r_bins == 0 || grid.x_bins == 0) {
        return grid;
    }

    for (size_t i = 0; i < cloud.size(); ++i) {
        int rb = binIndex(grid.r_edges, cloud.r[i]);
        int xb = binIndex(grid.x_edges, cloud.x[i]);
        if (rb < 0 || xb < 0) {
            continue;
        }
        ++grid.counts[static_cast<size_t>(xb) * grid.r_bins + rb];
    }
    return grid;
}

DensityResult sweepWithDensity(SweepParams const& params, int x_bins) {
    return sweepWithDensity(params, params.r_count, x_bins);
}

DensityResult sweepWithDensity(SweepParams const& params, int r_bins, int x_bins) {
    DensityResult result;
    result.cloud = sweep(params);

    auto start = Clock::now();
    result.grid = histogram(result.cloud, params, r_bins, x_bins);
    result.computation_seconds =
        result.cloud.computation_seconds + Duration(Clock::now() - start).count();
    return result;
}

} // namespace bifurcation
