#pragma once

#include "bifurcation.h"
#include "predictability/scenario_comparison.h"
#include "regime.h"
#include "statistic_kind.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Offset added to the model's x0 so truth and model start apart by default
inline constexpr double kModelInitOffset = 1e-5;

// One (x0, r) pair. Truth and model each get their own.
struct StateParams {
    double r = 3.75;
    double x0 = 0.25;
};

struct SimulationParams {
    int steps = 100;
    double error_threshold = 0.1;
    Regime regime = Regime::Chaotic;

    // Unset = seeded from std::random_device (runs are not reproducible)
    std::optional<uint64_t> seed;
};

struct EnsembleConfig {
    bool enabled = false;
    int size = 50;
    double init_perturbation_sd = 1e-4;
    double param_perturbation_sd = 0.0;
    StatisticKind statistic = StatisticKind::Mean;

    // Per-step mode estimation. Forced on when statistic == Mode.
    bool track_mode = true;
};

struct BifurcationConfig {
    bifurcation::SweepParams sweep{2.5, 4.0, 1000, 0.0, 1.0, 200, 1000};
    int x_bins = 1000;
    bool density = true;
};

struct TableConfig {
    std::vector<double> r_values = {3.7, 3.75, 3.8, 3.85, 3.9};
    std::vector<double> model_bias_values = {0.0, 1e-10, 3.162277660168379e-08, 1e-05};
    std::vector<double> ic_bias_values = {1e-13, 1e-12, 1e-11, 1e-10, 1e-09, 1e-08,
                                          1e-07, 1e-06, 1e-05, 1e-04, 1e-03};
    int ensemble_size = 50;
    int iterations = 1000;
    double threshold = 0.1;
    uint64_t seed = 42;
    int thread_count = 0; // 0 = auto
    std::string path = "data/predictability_table.json";
};

enum class OutputMode {
    Timestamped, // output/run_YYYYMMDD_HHMMSS/
    Direct       // write straight into the output directory
};

struct OutputParams {
    std::string directory = "output";
    OutputMode mode = OutputMode::Timestamped;

    // Full member x step matrix as ensemble.csv
    bool save_ensemble = false;
};

struct Config {
    StateParams truth;
    StateParams model{3.75, 0.25 + kModelInitOffset};
    SimulationParams simulation;
    EnsembleConfig ensemble;
    BifurcationConfig bifurcation;
    predictability::ComparisonParams comparison;
    TableConfig table;
    OutputParams output;

    // Load from TOML file
    static Config load(std::string const& path);

    // Default configuration
    static Config defaults();

    // Save resolved parameters as TOML
    bool save(std::string const& path) const;

    // Apply a single "section.key" override from the command line
    // Returns true if successful, false if key not found or parse error
    bool applyOverride(std::string const& key, std::string const& value);

    // Reset truth and model (r, x0) to the regime's slider defaults. The model
    // x0 keeps its kModelInitOffset.
    void applyRegime(Regime regime);

    // Warn (without changing anything) when r lies outside the regime's slider range
    void warnOutsideRegime() const;
};
