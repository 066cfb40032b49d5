// =============================================================================
// Predictability lookup table
// =============================================================================

#include <catch2/catch.hpp>

#include "predictability/predictability_table.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace predictability;

namespace {

std::string const kTablePath = std::string(TEST_DATA_DIR) + "/predictability_table.json";

std::string tempPath(std::string const& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST_CASE("published table loads with its axes", "[table]") {
    auto table = PredictabilityTable::load(kTablePath);
    auto const& axes = table.axes();

    REQUIRE(axes.r_values.size() == 5);
    REQUIRE(axes.model_bias_values.size() == 4);
    REQUIRE(axes.ic_bias_values.size() == 11);
    REQUIRE_FALSE(table.empty());

    REQUIRE(table.at(StatisticKind::Median, 0, 0, 0) == 90);
    REQUIRE(table.at(StatisticKind::Mean, 3, 0, 0) == 1000);

    auto row = table.row(0, 0);
    REQUIRE(row.mean == std::vector<int>{88, 79, 73, 69, 63, 57, 50, 39, 26, 17, 11});
    REQUIRE(row.median.size() == 11);
    REQUIRE(row.mode.size() == 11);
    REQUIRE(&row.get(StatisticKind::Mode) == &row.mode);
}

TEST_CASE("lookup snaps to the nearest grid point", "[table]") {
    auto table = PredictabilityTable::load(kTablePath);

    REQUIRE(table.lookup(3.71, 0.0, 1e-13, StatisticKind::Median) == 90);
    REQUIRE(table.lookup(3.7, 0.0, 1e-13, StatisticKind::Median) ==
            table.at(StatisticKind::Median, 0, 0, 0));

    // r -> 3.85, model bias -> 1e-10, ic bias -> 1e-10
    REQUIRE(table.lookup(3.86, 1e-9, 2e-10, StatisticKind::Mean) ==
            table.at(StatisticKind::Mean, 3, 1, 3));

    // Far outside the axes clamps to the ends
    REQUIRE(table.lookup(10.0, 1.0, 1.0, StatisticKind::Mode) ==
            table.at(StatisticKind::Mode, 4, 3, 10));
}

TEST_CASE("nearestIndex snaps linearly on axes containing zero", "[table]") {
    std::vector<double> axis{0.0, 1.0, 2.0, 4.0};
    REQUIRE(nearestIndex(axis, -1.0) == 0);
    REQUIRE(nearestIndex(axis, 0.4) == 0);
    REQUIRE(nearestIndex(axis, 1.5) == 1); // tie goes to the first
    REQUIRE(nearestIndex(axis, 2.9) == 1);
    REQUIRE(nearestIndex(axis, 3.1) == 3);
    REQUIRE(nearestIndex(axis, 100.0) == 3);
    REQUIRE_THROWS_AS(nearestIndex({}, 1.0), std::invalid_argument);
}

TEST_CASE("nearestIndex snaps in log space on positive axes", "[table]") {
    std::vector<double> axis{1e-10, 1e-9, 1e-8};
    REQUIRE(nearestIndex(axis, 5e-10) == 1);
    REQUIRE(nearestIndex(axis, 2e-10) == 0);
    REQUIRE(nearestIndex(axis, 4e-9) == 2);
    REQUIRE(nearestIndex(axis, 1e-7) == 2);
    REQUIRE(nearestIndex(axis, 1e-20) == 0);

    // Non-positive queries fall back to linear distance
    REQUIRE(nearestIndex(axis, 0.0) == 0);
}

TEST_CASE("lookup on the ic-bias axis follows decades", "[table]") {
    auto table = PredictabilityTable::load(kTablePath);
    // 5e-10 is closer to 1e-9 than to 1e-10 on a log axis
    REQUIRE(table.lookup(3.7, 0.0, 5e-10, StatisticKind::Mean) ==
            table.at(StatisticKind::Mean, 0, 0, 4));
}

TEST_CASE("out of range indices throw", "[table]") {
    PredictabilityTable table(TableAxes{{3.7}, {0.0}, {1e-6, 1e-5}});
    REQUIRE(table.at(StatisticKind::Mean, 0, 0, 1) == 0);
    REQUIRE_THROWS_AS(table.at(StatisticKind::Mean, 1, 0, 0), std::out_of_range);
    REQUIRE_THROWS_AS(table.row(0, 1), std::out_of_range);
    REQUIRE_THROWS_AS(table.set(StatisticKind::Mode, 0, 0, 2, 5), std::out_of_range);
}

TEST_CASE("malformed tables are rejected", "[table]") {
    SECTION("missing file") {
        REQUIRE_THROWS_AS(PredictabilityTable::load(tempPath("no_such_table.json")),
                          std::runtime_error);
    }

    SECTION("invalid JSON") {
        std::string path = tempPath("logistic_bad_table.json");
        {
            std::ofstream out(path);
            out << "{ \"r_values\": [3.7, ";
        }
        REQUIRE_THROWS_AS(PredictabilityTable::load(path), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("surface shape does not match the axes") {
        auto j = nlohmann::json::parse(R"({
            "r_values": [3.7, 3.8],
            "model_bias_values": [0.0],
            "ic_bias_values": [1e-6],
            "surfaces": {
                "mean": [[[10]]],
                "median": [[[10]], [[12]]],
                "mode": [[[10]], [[12]]]
            }
        })");
        REQUIRE_THROWS_AS(PredictabilityTable::fromJSON(j), std::runtime_error);
    }

    SECTION("missing surface") {
        auto j = nlohmann::json::parse(R"({
            "r_values": [3.7],
            "model_bias_values": [0.0],
            "ic_bias_values": [1e-6],
            "surfaces": {"mean": [[[10]]]}
        })");
        REQUIRE_THROWS_AS(PredictabilityTable::fromJSON(j), std::runtime_error);
    }

    SECTION("empty axis") {
        auto j = nlohmann::json::parse(R"({
            "r_values": [],
            "model_bias_values": [0.0],
            "ic_bias_values": [1e-6],
            "surfaces": {}
        })");
        REQUIRE_THROWS_AS(PredictabilityTable::fromJSON(j), std::runtime_error);
    }
}

TEST_CASE("saved table loads back unchanged", "[table]") {
    auto table = PredictabilityTable::load(kTablePath);
    std::string path = tempPath("logistic_table_copy.json");

    REQUIRE(table.save(path));
    auto copy = PredictabilityTable::load(path);
    REQUIRE(copy.axes().r_values == table.axes().r_values);
    REQUIRE(copy.toJSON() == table.toJSON());

    std::filesystem::remove(path);
}

TEST_CASE("generated table does not depend on the thread count", "[table]") {
    TableSpec spec;
    spec.axes = TableAxes{{3.7, 3.9}, {0.0, 1e-5}, {1e-8, 1e-4}};
    spec.ensemble_size = 10;
    spec.iterations = 120;
    spec.threshold = 0.1;

    auto single = generateTable(spec, 42, 1);
    auto parallel = generateTable(spec, 42, 4);
    REQUIRE(single.toJSON() == parallel.toJSON());

    for (size_t r = 0; r < 2; ++r) {
        for (size_t m = 0; m < 2; ++m) {
            for (size_t k = 0; k < 2; ++k) {
                int limit = single.at(StatisticKind::Median, r, m, k);
                REQUIRE(limit >= 0);
                REQUIRE(limit <= spec.iterations);
            }
        }
    }

    // Mode cells reuse the median definition but draw their own stream
    REQUIRE(single.at(StatisticKind::Mode, 0, 0, 0) >= 0);
}

TEST_CASE("table generation reports progress", "[table]") {
    TableSpec spec;
    spec.axes = TableAxes{{3.8}, {0.0}, {1e-6}};
    spec.ensemble_size = 5;
    spec.iterations = 40;

    int last_done = -1;
    int last_total = -1;
    generateTable(spec, 1, 2, [&](int done, int total) {
        last_done = done;
        last_total = total;
    });
    REQUIRE(last_total == 3);
    REQUIRE(last_done == 3);
}

TEST_CASE("empty axes give an empty table", "[table]") {
    TableSpec spec;
    spec.axes = TableAxes{{}, {0.0}, {1e-6}};
    auto table = generateTable(spec, 1, 1);
    REQUIRE(table.empty());
}
