#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bifurcation {

struct SweepParams {
    double r_min = 2.5;
    double r_max = 4.0;
    int r_count = 800;
    double x_min = 0.0; // recording window, inclusive
    double x_max = 1.0;
    int iterations_discard = 300;
    int iterations_record = 1000;
};

// Flattened (r, x) samples, equal length
struct BifurcationCloud {
    std::vector<double> r;
    std::vector<double> x;
    double computation_seconds = 0.0;

    size_t size() const { return r.size(); }
    bool empty() const { return r.empty(); }
};

// 2D histogram stored transposed: row = x bin, column = r bin
struct DensityGrid {
    int x_bins = 0;
    int r_bins = 0;
    std::vector<uint64_t> counts; // counts[x_bin * r_bins + r_bin]
    std::vector<double> r_edges;  // r_bins + 1
    std::vector<double> x_edges;  // x_bins + 1

    uint64_t at(int x_bin, int r_bin) const {
        return counts[static_cast<size_t>(x_bin) * r_bins + r_bin];
    }
    uint64_t total() const;
    uint64_t maxCount() const;
};

struct DensityResult {
    DensityGrid grid;
    BifurcationCloud cloud;
    double computation_seconds = 0.0; // sweep + histogram
};

// Start every r at x = 0.5, discard transients, then record each iteration's
// states that fall inside [x_min, x_max]. An empty window gives an empty cloud.
BifurcationCloud sweep(SweepParams const& params);

// Bin a cloud over the sweep's r-window and x-window. Bins are half-open
// except the last one in each direction; points outside the edges are dropped.
DensityGrid histogram(BifurcationCloud const& cloud, SweepParams const& params, int r_bins,
                      int x_bins);

// sweep() followed by histogram() with r_bins = params.r_count
DensityResult sweepWithDensity(SweepParams const& params, int x_bins);
DensityResult sweepWithDensity(SweepParams const& params, int r_bins, int x_bins);

} // namespace bifurcation
