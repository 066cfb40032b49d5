// =============================================================================
// Truth vs model simulation
// =============================================================================

#include <catch2/catch.hpp>

#include "simulation.h"

#include <algorithm>

namespace {

SimulationRequest chaoticRequest() {
    SimulationRequest request;
    request.truth = {3.9, 0.5};
    request.model = {3.9, 0.50001};
    request.steps = 50;
    request.error_threshold = 0.01;
    return request;
}

} // namespace

TEST_CASE("nearby initial conditions lose skill within the run", "[simulation]") {
    RandomEngine rng = makeEngine(1);
    auto results = runSimulation(chaoticRequest(), rng);

    REQUIRE(results.truth.size() == 50);
    REQUIRE(results.model_det.size() == 50);
    REQUIRE(results.truth.front() == 0.5);
    REQUIRE(results.model_det.front() == 0.50001);
    REQUIRE(results.prediction.index > 0);
    REQUIRE(results.prediction.index < 50);
    REQUIRE(results.prediction.abs_error[results.prediction.index] > 0.01);
    for (int t = 0; t < results.prediction.index; ++t) {
        REQUIRE(results.prediction.abs_error[t] <= 0.01);
    }

    // The 1e-5 offset has grown by three orders of magnitude at the crossing and
    // keeps growing to order one once the trajectories decorrelate
    auto const& err = results.prediction.abs_error;
    REQUIRE(err.front() == Approx(1e-5).epsilon(1e-6));
    REQUIRE(err[results.prediction.index] > 1000.0 * err.front());
    double late_max = *std::max_element(err.begin() + results.prediction.index, err.end());
    REQUIRE(late_max > 0.1);
}

TEST_CASE("without an ensemble the deterministic model is compared", "[simulation]") {
    RandomEngine rng = makeEngine(2);
    auto request = chaoticRequest();
    request.statistic = StatisticKind::Median;

    auto results = runSimulation(request, rng);
    REQUIRE_FALSE(results.hasEnsemble());
    REQUIRE_FALSE(results.error_bounds.has_value());
    REQUIRE(results.selected == results.model_det);
    REQUIRE(results.statistic == StatisticKind::Median);
}

TEST_CASE("identical truth and model run the full horizon", "[simulation]") {
    SimulationRequest request;
    request.truth = {3.75, 0.25};
    request.model = {3.75, 0.25};
    request.steps = 200;

    RandomEngine rng = makeEngine(3);
    auto results = runSimulation(request, rng);
    REQUIRE(results.prediction.index == 200);
    REQUIRE_FALSE(results.prediction.exceeded());
}

TEST_CASE("ensemble run selects the requested statistic", "[simulation]") {
    auto request = chaoticRequest();
    request.ensemble_enabled = true;
    request.ensemble_size = 30;
    request.init_perturbation_sd = 1e-5;
    request.statistic = StatisticKind::Median;
    request.track_mode = false;

    RandomEngine rng = makeEngine(4);
    auto results = runSimulation(request, rng);

    REQUIRE(results.hasEnsemble());
    REQUIRE(results.ensemble->matrix.members() == 30);
    REQUIRE(results.ensemble->matrix.steps() == 50);
    REQUIRE(results.error_bounds.has_value());
    REQUIRE(results.error_bounds->size() == 50);
    REQUIRE(results.selected == results.ensemble->statistics.median);
    REQUIRE_FALSE(results.ensemble->statistics.hasMode());
    REQUIRE(results.timing.ensemble_seconds <= results.timing.total_seconds);
}

TEST_CASE("mode statistic forces mode tracking", "[simulation]") {
    auto request = chaoticRequest();
    request.ensemble_enabled = true;
    request.ensemble_size = 20;
    request.init_perturbation_sd = 1e-5;
    request.statistic = StatisticKind::Mode;
    request.track_mode = false;

    RandomEngine rng = makeEngine(5);
    auto results = runSimulation(request, rng);
    REQUIRE(results.ensemble->statistics.hasMode());
    REQUIRE(results.selected == results.ensemble->statistics.mode);
}

TEST_CASE("reselect switches statistic and threshold without re-running", "[simulation]") {
    auto request = chaoticRequest();
    request.ensemble_enabled = true;
    request.ensemble_size = 25;
    request.init_perturbation_sd = 1e-5;
    request.track_mode = false;

    RandomEngine rng = makeEngine(6);
    auto results = runSimulation(request, rng);
    auto const matrix = results.ensemble->matrix.data();
    REQUIRE(results.selected == results.ensemble->statistics.mean);

    reselect(results, StatisticKind::Mode, 0.01);
    REQUIRE(results.ensemble->matrix.data() == matrix);
    REQUIRE(results.ensemble->statistics.hasMode());
    REQUIRE(results.selected == results.ensemble->statistics.mode);
    REQUIRE(results.statistic == StatisticKind::Mode);

    int const tight = results.prediction.index;
    reselect(results, StatisticKind::Mode, 0.5);
    REQUIRE(results.threshold == 0.5);
    REQUIRE(results.prediction.index >= tight);
}

TEST_CASE("request mirrors the config", "[simulation]") {
    Config config = Config::defaults();
    config.truth = {3.8, 0.3};
    config.model = {3.81, 0.31};
    config.simulation.steps = 77;
    config.ensemble.enabled = true;
    config.ensemble.size = 12;
    config.ensemble.statistic = StatisticKind::Median;

    auto request = SimulationRequest::fromConfig(config);
    REQUIRE(request.truth.r == 3.8);
    REQUIRE(request.model.x0 == 0.31);
    REQUIRE(request.steps == 77);
    REQUIRE(request.ensemble_enabled);
    REQUIRE(request.ensemble_size == 12);
    REQUIRE(request.statistic == StatisticKind::Median);
    REQUIRE(request.init_perturbation_sd == config.ensemble.init_perturbation_sd);
}
