#include "bifurcation.h"
#include "config.h"
#include "enum_utils.h"
#include "predictability/limit_scan.h"
#include "predictability/predictability_table.h"
#include "predictability/scenario_comparison.h"
#include "results_io.h"
#include "simulation.h"

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

void printUsage(char const* program) {
    std::cout << "Logistic Map Predictability\n\n"
              << "Usage:\n"
              << "  " << program << " <command> [config.toml] [options]\n"
              << "  " << program << " -h, --help              Show this help\n\n"
              << "Commands:\n"
              << "  simulate      Truth vs model run, optionally with an ensemble\n"
              << "  bifurcation   Bifurcation sweep and density grid\n"
              << "  compare       Error growth of several (ic_bias, model_bias) scenarios\n"
              << "  limit         Single-scenario predictability limit scan\n"
              << "  lookup        Query the precomputed predictability table\n\n"
              << "Options:\n"
              << "  --set <key>=<value>    Override config parameter (can be used multiple times)\n"
              << "  --seed <N>             Seed the random stream (runs become reproducible)\n\n"
              << "Parameter keys use dot notation: section.parameter\n"
              << "  Sections: truth, model, simulation, ensemble, bifurcation, comparison, table, output\n"
              << "  Statistics: " << enum_utils::joinNames(enum_utils::names<StatisticKind>()) << "\n"
              << "  Regimes:    " << enum_utils::joinNames(enum_utils::names<Regime>()) << "\n\n"
              << "Examples:\n"
              << "  " << program << " simulate config/default.toml\n"
              << "  " << program << " simulate config/default.toml --set ensemble.enabled=true --set ensemble.statistic=mode\n"
              << "  " << program << " bifurcation config/default.toml --set bifurcation.r_count=2000\n"
              << "  " << program << " limit config/default.toml --seed 42\n";
}

// Parsed command-line options
struct CLIOptions {
    std::string command;
    std::string config_path = "config/default.toml";
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<uint64_t> seed;
};

// Parse --set key=value argument
std::optional<std::pair<std::string, std::string>> parseSetArg(std::string const& arg) {
    auto eq_pos = arg.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "Invalid --set argument (missing '='): " << arg << "\n";
        return std::nullopt;
    }
    return std::make_pair(arg.substr(0, eq_pos), arg.substr(eq_pos + 1));
}

std::optional<Config> loadConfig(CLIOptions const& opts) {
    std::cout << "Loading config from: " << opts.config_path << "\n";
    Config config = Config::load(opts.config_path);

    for (auto const& [key, value] : opts.overrides) {
        if (!config.applyOverride(key, value)) {
            return std::nullopt;
        }
        std::cout << "Override: " << key << " = " << value << "\n";
    }
    if (opts.seed) {
        config.simulation.seed = opts.seed;
    }
    return config;
}

int runSimulate(Config const& config) {
    SimulationRequest request = SimulationRequest::fromConfig(config);

    std::cout << "\n=== Logistic Map Simulation ===\n\n"
              << "Truth:      r=" << request.truth.r << ", x0=" << request.truth.x0 << "\n"
              << "Model:      r=" << request.model.r << ", x0=" << request.model.x0 << "\n"
              << "Steps:      " << request.steps << "\n"
              << "Threshold:  " << request.error_threshold << "\n";
    if (request.ensemble_enabled) {
        std::cout << "Ensemble:   " << request.ensemble_size << " members, init sd="
                  << request.init_perturbation_sd << ", param sd=" << request.param_perturbation_sd
                  << ", statistic=" << enum_utils::toString(request.statistic) << "\n";
    } else {
        std::cout << "Ensemble:   disabled\n";
    }
    std::cout << "\n";

    RandomEngine rng = makeEngine(config.simulation.seed);
    SimulationResults results = runSimulation(request, rng);

    if (results.prediction.exceeded()) {
        std::cout << "Predictability limit: step " << results.prediction.index << "\n";
    } else {
        std::cout << "Predictability limit: not reached within " << request.steps << " steps\n";
    }
    if (results.ensemble) {
        auto const& initial = results.ensemble->initial;
        std::cout << "Initial ensemble: mean=" << initial.mean << ", median=" << initial.median
                  << ", mode=" << initial.mode << " ("
                  << enum_utils::toString(initial.mode_source) << ")\n";
    }
    std::cout << "Time: " << std::fixed << std::setprecision(3) << results.timing.total_seconds
              << "s\n";

    std::string dir = results_io::createRunDirectory(config.output);
    nlohmann::json j;
    j["version"] = "1.0";
    j["command"] = "simulate";
    j["created_at"] = results_io::timestamp();
    j["parameters"] = results_io::toJSON(request);
    j["results"] = results_io::toJSON(results);

    bool ok = config.save(dir + "/config.toml");
    ok = results_io::writeJSON(dir + "/results.json", j) && ok;
    ok = results_io::writeSimulationCSV(dir, results, config.output.save_ensemble) && ok;
    std::cout << "Output: " << dir << "/\n";
    return ok ? 0 : 1;
}

int runBifurcation(Config const& config) {
    auto const& bif = config.bifurcation;
    std::cout << "\n=== Bifurcation Diagram ===\n\n"
              << "r:          [" << bif.sweep.r_min << ", " << bif.sweep.r_max << "] x "
              << bif.sweep.r_count << "\n"
              << "x window:   [" << bif.sweep.x_min << ", " << bif.sweep.x_max << "]\n"
              << "Iterations: " << bif.sweep.iterations_discard << " discarded, "
              << bif.sweep.iterations_record << " recorded\n\n";

    std::string dir = results_io::createRunDirectory(config.output);
    nlohmann::json j;
    j["version"] = "1.0";
    j["command"] = "bifurcation";
    j["created_at"] = results_io::timestamp();
    j["parameters"] = results_io::toJSON(bif.sweep);

    bool ok = config.save(dir + "/config.toml");

    if (bif.density) {
        auto result = bifurcation::sweepWithDensity(bif.sweep, bif.x_bins);
        std::cout << "Points: " << result.cloud.size() << ", grid " << result.grid.x_bins << "x"
                  << result.grid.r_bins << ", max count " << result.grid.maxCount() << "\n";
        std::cout << "Time: " << std::fixed << std::setprecision(3)
                  << result.computation_seconds << "s\n";

        j["results"] = {{"point_count", result.cloud.size()},
                        {"x_bins", result.grid.x_bins},
                        {"r_bins", result.grid.r_bins},
                        {"max_count", result.grid.maxCount()},
                        {"computation_seconds", result.computation_seconds}};
        ok = results_io::writeCloudCSV(dir + "/bifurcation.csv", result.cloud) && ok;
        ok = results_io::writeDensityCSV(dir + "/density.csv", result.grid) && ok;
    } else {
        auto cloud = bifurcation::sweep(bif.sweep);
        std::cout << "Points: " << cloud.size() << "\n";
        std::cout << "Time: " << std::fixed << std::setprecision(3) << cloud.computation_seconds
                  << "s\n";

        j["results"] = {{"point_count", cloud.size()},
                        {"computation_seconds", cloud.computation_seconds}};
        ok = results_io::writeCloudCSV(dir + "/bifurcation.csv", cloud) && ok;
    }

    ok = results_io::writeJSON(dir + "/results.json", j) && ok;
    std::cout << "Output: " << dir << "/\n";
    return ok ? 0 : 1;
}

int runCompare(Config const& config) {
    auto const& cmp = config.comparison;
    std::cout << "\n=== Scenario Comparison ===\n\n"
              << "r:          " << cmp.r << "\n"
              << "Starts:     " << cmp.ic_count << " in [" << cmp.ic_min << ", " << cmp.ic_max
              << "]\n"
              << "Ensemble:   " << cmp.ensemble_size << " members, "
              << enum_utils::toString(cmp.statistic) << "\n"
              << "Scenarios:  " << cmp.scenarios.size() << "\n\n";

    RandomEngine rng = makeEngine(config.simulation.seed);
    auto result = predictability::compareScenarios(cmp, rng, [](int done, int total) {
        std::cout << "\rSimulating: " << done << "/" << total << std::flush;
    });
    std::cout << "\n\n";

    for (size_t i = 0; i < result.curves.size(); ++i) {
        auto const& curve = result.curves[i];
        std::cout << (i == 0 ? "  [ref] " : "        ") << "ic_bias=" << std::scientific
                  << std::setprecision(1) << curve.scenario.ic_bias
                  << " model_bias=" << curve.scenario.model_bias << std::defaultfloat
                  << "  limit=" << curve.index << "\n";
    }

    std::string dir = results_io::createRunDirectory(config.output);
    nlohmann::json j;
    j["version"] = "1.0";
    j["command"] = "compare";
    j["created_at"] = results_io::timestamp();
    j["results"] = results_io::toJSON(result);

    bool ok = config.save(dir + "/config.toml");
    ok = results_io::writeJSON(dir + "/results.json", j) && ok;
    ok = results_io::writeComparisonCSV(dir + "/comparison.csv", result) && ok;
    std::cout << "Output: " << dir << "/\n";
    return ok ? 0 : 1;
}

// Scan parameters from the truth/model pair: model_bias = r_model - r_truth,
// ic_bias = |x0_model - x0_truth|
predictability::LimitScanParams limitParamsFromConfig(Config const& config) {
    predictability::LimitScanParams params;
    params.r = config.truth.r;
    params.model_bias = config.model.r - config.truth.r;
    params.ic_bias = std::abs(config.model.x0 - config.truth.x0);
    params.ensemble_size = config.ensemble.size;
    params.iterations = config.simulation.steps;
    params.threshold = config.simulation.error_threshold;
    params.metric = config.ensemble.statistic;
    return params;
}

int runLimit(Config const& config) {
    auto params = limitParamsFromConfig(config);
    std::cout << "\n=== Predictability Limit Scan ===\n\n"
              << "r=" << params.r << ", model_bias=" << params.model_bias
              << ", ic_bias=" << params.ic_bias << "\n"
              << params.ensemble_size << " trials x " << params.iterations
              << " iterations, threshold " << params.threshold << ", "
              << enum_utils::toString(params.metric) << "\n\n";

    RandomEngine rng = makeEngine(config.simulation.seed);
    int limit = predictability::singleScenarioPredictabilityLimit(params, rng);
    std::cout << "Predictability limit: " << limit;
    if (limit >= params.iterations) {
        std::cout << " (not reached)";
    }
    std::cout << "\n";
    return 0;
}

int runLookup(Config const& config) {
    auto params = limitParamsFromConfig(config);

    predictability::PredictabilityTable table;
    try {
        table = predictability::PredictabilityTable::load(config.table.path);
    } catch (std::runtime_error const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto const& axes = table.axes();
    size_t r_i = predictability::nearestIndex(axes.r_values, params.r);
    size_t m_i = predictability::nearestIndex(axes.model_bias_values, params.model_bias);
    size_t ic_i = predictability::nearestIndex(axes.ic_bias_values, params.ic_bias);

    std::cout << "\nNearest grid point: r=" << axes.r_values[r_i]
              << ", model_bias=" << axes.model_bias_values[m_i]
              << ", ic_bias=" << axes.ic_bias_values[ic_i] << "\n";
    std::cout << "Limit (" << enum_utils::toString(params.metric)
              << "): " << table.at(params.metric, r_i, m_i, ic_i) << "\n\n";

    auto row = table.row(r_i, m_i);
    std::cout << std::setw(10) << "ic_bias" << std::setw(8) << "mean" << std::setw(8) << "median"
              << std::setw(8) << "mode" << "\n";
    for (size_t k = 0; k < axes.ic_bias_values.size(); ++k) {
        std::cout << std::setw(10) << std::scientific << std::setprecision(0)
                  << axes.ic_bias_values[k] << std::defaultfloat << std::setw(8) << row.mean[k]
                  << std::setw(8) << row.median[k] << std::setw(8) << row.mode[k] << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    CLIOptions opts;
    opts.command = arg;

    int i = 2;
    if (i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        opts.config_path = argv[i++];
    }

    for (; i < argc; ++i) {
        std::string opt = argv[i];
        if (opt == "--set" && i + 1 < argc) {
            auto parsed = parseSetArg(argv[++i]);
            if (!parsed) return 1;
            opts.overrides.push_back(*parsed);
        } else if (opt == "--seed" && i + 1 < argc) {
            try {
                opts.seed = std::stoull(argv[++i]);
            } catch (std::exception const&) {
                std::cerr << "Invalid --seed value: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            return 1;
        }
    }

    auto config = loadConfig(opts);
    if (!config) {
        return 1;
    }

    try {
        if (opts.command == "simulate") return runSimulate(*config);
        if (opts.command == "bifurcation") return runBifurcation(*config);
        if (opts.command == "compare") return runCompare(*config);
        if (opts.command == "limit") return runLimit(*config);
        if (opts.command == "lookup") return runLookup(*config);
    } catch (std::filesystem::filesystem_error const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << opts.command << "\n\n";
    printUsage(argv[0]);
    return 1;
}
