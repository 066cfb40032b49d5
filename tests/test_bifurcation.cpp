// =============================================================================
// Bifurcation sweep and density histogram
// =============================================================================

#include <catch2/catch.hpp>

#include "bifurcation.h"
#include "logistic_map.h"

#include <cmath>
#include <cstdint>
#include <vector>

using namespace bifurcation;

TEST_CASE("cloud arrays have equal length inside the window", "[bifurcation]") {
    SweepParams params;
    params.r_min = 2.8;
    params.r_max = 3.95;
    params.r_count = 60;
    params.x_min = 0.3;
    params.x_max = 0.7;
    params.iterations_discard = 100;
    params.iterations_record = 50;

    auto cloud = sweep(params);
    REQUIRE(cloud.r.size() == cloud.x.size());
    REQUIRE_FALSE(cloud.empty());
    for (size_t i = 0; i < cloud.size(); ++i) {
        REQUIRE(cloud.x[i] >= 0.3);
        REQUIRE(cloud.x[i] <= 0.7);
        REQUIRE(cloud.r[i] >= 2.8);
        REQUIRE(cloud.r[i] <= 3.95);
    }
}

TEST_CASE("full window records every r at every iteration", "[bifurcation]") {
    SweepParams params;
    params.r_min = 2.5;
    params.r_max = 3.9;
    params.r_count = 50;
    params.iterations_discard = 20;
    params.iterations_record = 100;

    auto cloud = sweep(params);
    REQUIRE(cloud.size() == 50u * 100u);
}

TEST_CASE("stable region collapses onto the fixed point", "[bifurcation]") {
    SweepParams params;
    params.r_min = 2.5;
    params.r_max = 2.9;
    params.r_count = 5;
    params.iterations_discard = 500;
    params.iterations_record = 10;

    auto cloud = sweep(params);
    REQUIRE(cloud.size() == 50);
    for (size_t i = 0; i < cloud.size(); ++i) {
        REQUIRE(cloud.x[i] == Approx(logistic::fixedPoint(cloud.r[i])).margin(1e-9));
    }

    SECTION("a window that excludes the attractor gives an empty cloud") {
        params.x_min = 0.7;
        params.x_max = 1.0;
        REQUIRE(sweep(params).empty());
    }
}

TEST_CASE("histogram counts every point inside the edges", "[bifurcation]") {
    SweepParams params;
    params.r_min = 2.5;
    params.r_max = 3.9;
    params.r_count = 40;
    params.iterations_discard = 50;
    params.iterations_record = 30;

    auto result = sweepWithDensity(params, 25);
    REQUIRE(result.grid.r_bins == 40);
    REQUIRE(result.grid.x_bins == 25);
    REQUIRE(result.grid.counts.size() == 40u * 25u);
    REQUIRE(result.grid.r_edges.size() == 41);
    REQUIRE(result.grid.x_edges.size() == 26);
    REQUIRE(result.grid.total() == result.cloud.size());
    REQUIRE(result.computation_seconds >= result.cloud.computation_seconds);
}

TEST_CASE("every density bin matches a recount of the cloud", "[bifurcation]") {
    SweepParams params;
    params.r_min = 3.4;
    params.r_max = 4.0;
    params.r_count = 30;
    params.x_min = 0.2;
    params.x_max = 0.9;
    params.iterations_discard = 40;
    params.iterations_record = 60;

    int const r_bins = 12;
    int const x_bins = 9;
    auto cloud = sweep(params);
    auto grid = histogram(cloud, params, r_bins, x_bins);

    // Linear scan over the edges: [e_i, e_i+1), last bin closed
    auto binOf = [](std::vector<double> const& edges, double v) {
        int const bins = static_cast<int>(edges.size()) - 1;
        for (int b = 0; b < bins; ++b) {
            bool const last = b == bins - 1;
            if (v >= edges[b] && (v < edges[b + 1] || (last && v == edges[b + 1]))) {
                return b;
            }
        }
        return -1;
    };

    std::vector<uint64_t> expected(static_cast<size_t>(r_bins) * x_bins, 0);
    for (size_t i = 0; i < cloud.size(); ++i) {
        int rb = binOf(grid.r_edges, cloud.r[i]);
        int xb = binOf(grid.x_edges, cloud.x[i]);
        REQUIRE(rb >= 0);
        REQUIRE(xb >= 0);
        ++expected[static_cast<size_t>(xb) * r_bins + rb];
    }

    for (int xb = 0; xb < x_bins; ++xb) {
        for (int rb = 0; rb < r_bins; ++rb) {
            REQUIRE(grid.at(xb, rb) == expected[static_cast<size_t>(xb) * r_bins + rb]);
        }
    }
    REQUIRE(grid.total() == cloud.size());
}

TEST_CASE("histogram bins are half-open except the last", "[bifurcation]") {
    SweepParams params;
    params.r_min = 0.0;
    params.r_max = 1.0;
    params.x_min = 0.0;
    params.x_max = 1.0;

    BifurcationCloud cloud;
    cloud.r = {0.0, 0.5, 1.0, 1.0, -0.1};
    cloud.x = {0.0, 0.5, 1.0, 2.0, 0.5};

    auto grid = histogram(cloud, params, 2, 2);
    REQUIRE(grid.at(0, 0) == 1);
    REQUIRE(grid.at(1, 1) == 2);
    REQUIRE(grid.at(0, 1) == 0);
    REQUIRE(grid.at(1, 0) == 0);
    REQUIRE(grid.total() == 3);
    REQUIRE(grid.maxCount() == 2);
}

TEST_CASE("histogram with zero bins is empty", "[bifurcation]") {
    BifurcationCloud cloud;
    cloud.r = {3.0};
    cloud.x = {0.5};

    auto grid = histogram(cloud, SweepParams{}, 0, 10);
    REQUIRE(grid.counts.empty());
    REQUIRE(grid.total() == 0);
    REQUIRE(grid.maxCount() == 0);
}
