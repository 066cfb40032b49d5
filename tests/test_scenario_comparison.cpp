// =============================================================================
// Scenario comparison
// =============================================================================

#include <catch2/catch.hpp>

#include "predictability/scenario_comparison.h"

#include <algorithm>

using namespace predictability;

namespace {

ComparisonParams smallParams() {
    ComparisonParams params;
    params.r = 3.7;
    params.ic_min = 0.2;
    params.ic_max = 0.8;
    params.ic_count = 3;
    params.ensemble_size = 10;
    params.steps = 30;
    params.threshold = 0.1;
    params.statistic = StatisticKind::Median;
    params.scenarios = {{1e-6, 1e-6}, {1e-6, 7.5e-5}, {5e-5, 7.5e-5}};
    return params;
}

} // namespace

TEST_CASE("one curve per scenario with one entry per step", "[comparison]") {
    RandomEngine rng = makeEngine(1);
    auto result = compareScenarios(smallParams(), rng);

    REQUIRE(result.ic_values.size() == 3);
    REQUIRE(result.ic_values[0] == 0.2);
    REQUIRE(result.ic_values[1] == Approx(0.5));
    REQUIRE(result.ic_values[2] == 0.8);
    REQUIRE(result.curves.size() == 3);
    REQUIRE(result.normalized_threshold.size() == 30);
    for (auto const& curve : result.curves) {
        REQUIRE(curve.error.size() == 30);
        REQUIRE(curve.error_p10.size() == 30);
        REQUIRE(curve.error_p90.size() == 30);
        REQUIRE(curve.normalized.size() == 30);
        REQUIRE(curve.index >= 0);
        REQUIRE(curve.index <= 30);
    }
    REQUIRE(result.curves[1].scenario.model_bias == 7.5e-5);
}

TEST_CASE("reference scenario normalizes to one", "[comparison]") {
    RandomEngine rng = makeEngine(2);
    auto params = smallParams();
    auto result = compareScenarios(params, rng);

    auto const& reference = result.curves.front();
    for (size_t t = 0; t < reference.error.size(); ++t) {
        double const floor_value = std::max(reference.error[t], kLogFloor);
        if (reference.error[t] > kLogFloor) {
            REQUIRE(reference.normalized[t] == Approx(1.0));
        }
        REQUIRE(result.normalized_threshold[t] == Approx(params.threshold / floor_value));
        for (auto const& curve : result.curves) {
            REQUIRE(curve.normalized[t] == Approx(curve.error[t] / floor_value));
        }
    }
}

TEST_CASE("crossing index matches the averaged error", "[comparison]") {
    RandomEngine rng = makeEngine(3);
    auto result = compareScenarios(smallParams(), rng);
    for (auto const& curve : result.curves) {
        REQUIRE(curve.index == firstCrossing(curve.error, 0.1));
    }
}

TEST_CASE("larger model bias loses skill no later on average", "[comparison]") {
    auto params = smallParams();
    params.ic_count = 5;
    params.ensemble_size = 20;
    params.steps = 60;
    params.scenarios = {{1e-8, 0.0}, {1e-8, 1e-3}};

    RandomEngine rng = makeEngine(4);
    auto result = compareScenarios(params, rng);
    REQUIRE(result.curves[1].index <= result.curves[0].index);
}

TEST_CASE("progress counts every run", "[comparison]") {
    auto params = smallParams();
    params.steps = 5;
    int calls = 0;
    int last_total = 0;

    RandomEngine rng = makeEngine(5);
    compareScenarios(params, rng, [&](int done, int total) {
        ++calls;
        REQUIRE(done == calls);
        last_total = total;
    });
    REQUIRE(calls == 9);
    REQUIRE(last_total == 9);
}

TEST_CASE("no scenarios or starting points gives an empty result", "[comparison]") {
    RandomEngine rng = makeEngine(6);

    auto params = smallParams();
    params.scenarios.clear();
    auto result = compareScenarios(params, rng);
    REQUIRE(result.curves.empty());
    REQUIRE(result.normalized_threshold.empty());

    params = smallParams();
    params.ic_count = 0;
    result = compareScenarios(params, rng);
    REQUIRE(result.curves.empty());
}
