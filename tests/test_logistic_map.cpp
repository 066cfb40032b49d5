// =============================================================================
// Logistic map and trajectory runner
// =============================================================================

#include <catch2/catch.hpp>

#include "logistic_map.h"
#include "trajectory.h"

#include <cmath>
#include <stdexcept>
#include <vector>

TEST_CASE("step applies r*x*(1-x)", "[map]") {
    REQUIRE(logistic::step(0.5, 4.0) == Approx(1.0));
    REQUIRE(logistic::step(0.25, 3.75) == Approx(3.75 * 0.25 * 0.75));
    REQUIRE(logistic::step(0.0, 3.9) == 0.0);
    REQUIRE(logistic::step(1.0, 3.9) == 0.0);
}

TEST_CASE("step accepts out-of-range inputs without clamping", "[map]") {
    // r > 4 pushes the peak above 1
    REQUIRE(logistic::step(0.5, 4.5) > 1.0);
    // x outside [0,1] goes negative
    REQUIRE(logistic::step(1.5, 3.0) < 0.0);

    double x = 0.5;
    for (int i = 0; i < 200; ++i) {
        x = logistic::step(x, 4.5);
    }
    REQUIRE_FALSE(std::isfinite(x));
}

TEST_CASE("vector step broadcasts a scalar r or pairs element-wise", "[map]") {
    std::vector<double> xs = {0.1, 0.5, 0.9};

    SECTION("scalar r") {
        auto out = logistic::step(xs, 2.0);
        REQUIRE(out.size() == 3);
        for (size_t i = 0; i < xs.size(); ++i) {
            REQUIRE(out[i] == Approx(logistic::step(xs[i], 2.0)));
        }
    }

    SECTION("per-element r") {
        std::vector<double> rs = {1.0, 2.0, 3.0};
        auto out = logistic::step(xs, rs);
        for (size_t i = 0; i < xs.size(); ++i) {
            REQUIRE(out[i] == Approx(logistic::step(xs[i], rs[i])));
        }
    }

    SECTION("mismatched lengths are rejected") {
        std::vector<double> rs = {1.0, 2.0};
        REQUIRE_THROWS_AS(logistic::stepInPlace(xs, rs), std::invalid_argument);
    }
}

TEST_CASE("runTrajectory records the state before each step", "[trajectory]") {
    for (double r : {0.5, 2.0, 3.2, 3.7, 3.99}) {
        for (double x0 : {0.0, 0.1, 0.5, 0.95}) {
            auto traj = runTrajectory(x0, r, 37);
            REQUIRE(traj.size() == 37);
            REQUIRE(traj[0] == x0);
            REQUIRE(traj[1] == logistic::step(x0, r));
        }
    }

    REQUIRE(runTrajectory(0.3, 3.5, 1) == Trajectory{0.3});
    REQUIRE(runTrajectory(0.3, 3.5, 0).empty());
    REQUIRE(runTrajectory(0.3, 3.5, -4).empty());
}

TEST_CASE("r = 0 collapses to the origin", "[trajectory]") {
    auto traj = runTrajectory(0.7, 0.0, 20);
    for (size_t t = 1; t < traj.size(); ++t) {
        REQUIRE(traj[t] == 0.0);
    }
}

TEST_CASE("single-valued regime converges to the fixed point", "[trajectory]") {
    for (double r : {1.5, 2.0, 2.5, 2.8}) {
        auto traj = runTrajectory(0.2, r, 500);
        REQUIRE(traj.back() == Approx(logistic::fixedPoint(r)).margin(1e-6));
    }
}

TEST_CASE("chaotic trajectories stay inside the unit interval", "[trajectory]") {
    auto traj = runTrajectory(0.123, 3.9, 1000);
    for (double x : traj) {
        REQUIRE(x >= 0.0);
        REQUIRE(x <= 1.0);
    }
}

TEST_CASE("absoluteDifference works over the common length", "[trajectory]") {
    std::vector<double> a = {0.1, 0.5, 0.9, 0.3};
    std::vector<double> b = {0.2, 0.5, 0.4};
    auto d = absoluteDifference(a, b);
    REQUIRE(d.size() == 3);
    REQUIRE(d[0] == Approx(0.1));
    REQUIRE(d[1] == 0.0);
    REQUIRE(d[2] == Approx(0.5));
}
