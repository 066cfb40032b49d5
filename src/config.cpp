#include "config.h"
#include "enum_utils.h"

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace {

// Safe value extraction helpers
template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return *val;
        }
    }
    return default_val;
}

std::string get_string_or(toml::table const& tbl, std::string_view key, std::string default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<std::string>()) {
            return *val;
        }
    }
    return default_val;
}

std::vector<double> get_doubles_or(toml::table const& tbl, std::string_view key,
                                   std::vector<double> default_val) {
    auto arr = tbl[key].as_array();
    if (!arr) {
        return default_val;
    }
    std::vector<double> result;
    for (auto const& elem : *arr) {
        if (auto val = elem.value<double>()) {
            result.push_back(*val);
        } else {
            std::cerr << "Warning: non-numeric entry in " << key << ", keeping defaults\n";
            return default_val;
        }
    }
    return result;
}

// Unknown names warn and keep the current value
template <typename E> E parseEnum(std::string const& str, E current, char const* what) {
    if (auto parsed = enum_utils::fromString<E>(str)) {
        return *parsed;
    }
    std::cerr << "Unknown " << what << ": " << str << " (expected "
              << enum_utils::joinNames(enum_utils::names<E>()) << "), using "
              << enum_utils::toString(current) << "\n";
    return current;
}

bool parseBool(std::string const& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw std::invalid_argument("expected true/false, got '" + value + "'");
}

// "3.7,3.8,3.9" -> {3.7, 3.8, 3.9}
std::vector<double> parseDoubleList(std::string const& value) {
    std::vector<double> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            result.push_back(std::stod(item));
        }
    }
    if (result.empty()) {
        throw std::invalid_argument("empty list");
    }
    return result;
}

// Shortest representation that reads back to the same double
std::string formatDouble(double value) {
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return "0.0";
    }
    std::string out(buf, end);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

// TOML basic string with quotes and escapes
std::string quoteString(std::string const& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out + "\"";
}

std::string formatList(std::vector<double> const& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += formatDouble(values[i]);
    }
    return out + "]";
}

} // namespace

Config Config::defaults() {
    return Config{};
}

void Config::applyRegime(Regime regime) {
    RegimeDefaults const& d = regimeDefaults(regime);
    simulation.regime = regime;
    truth.r = d.param_value;
    truth.x0 = d.init_value;
    model.r = d.param_value;
    model.x0 = d.init_value + kModelInitOffset;
}

void Config::warnOutsideRegime() const {
    RegimeDefaults const& d = regimeDefaults(simulation.regime);
    if (!d.param_limits.contains(truth.r) || !d.param_limits.contains(model.r)) {
        std::cerr << "Warning: r outside the " << d.label << " range [" << d.param_limits.min
                  << ", " << d.param_limits.max << "]\n";
    }
    if (!d.init_limits.contains(truth.x0) || !d.init_limits.contains(model.x0)) {
        std::cerr << "Warning: x0 outside [" << d.init_limits.min << ", " << d.init_limits.max
                  << "]\n";
    }
}

// Load config values from a TOML table into an existing config (for include support)
static void loadConfigFromTable(Config& config, toml::table const& tbl) {
    // Simulation first: a regime resets truth/model before explicit values apply
    if (auto sim = tbl["simulation"].as_table()) {
        config.simulation.steps = get_or(*sim, "steps", config.simulation.steps);
        config.simulation.error_threshold =
            get_or(*sim, "error_threshold", config.simulation.error_threshold);
        auto regime_str = get_string_or(*sim, "regime", "");
        if (!regime_str.empty()) {
            config.applyRegime(parseEnum(regime_str, config.simulation.regime, "regime"));
        }
        if (auto seed = sim->get("seed")) {
            if (auto val = seed->value<int64_t>()) {
                config.simulation.seed = static_cast<uint64_t>(*val);
            }
        }
    }

    if (auto truth = tbl["truth"].as_table()) {
        config.truth.r = get_or(*truth, "r", config.truth.r);
        config.truth.x0 = get_or(*truth, "x0", config.truth.x0);
    }

    if (auto model = tbl["model"].as_table()) {
        config.model.r = get_or(*model, "r", config.model.r);
        config.model.x0 = get_or(*model, "x0", config.model.x0);
    }

    if (auto ens = tbl["ensemble"].as_table()) {
        config.ensemble.enabled = get_or(*ens, "enabled", config.ensemble.enabled);
        config.ensemble.size = get_or(*ens, "size", config.ensemble.size);
        config.ensemble.init_perturbation_sd =
            get_or(*ens, "init_perturbation_sd", config.ensemble.init_perturbation_sd);
        config.ensemble.param_perturbation_sd =
            get_or(*ens, "param_perturbation_sd", config.ensemble.param_perturbation_sd);
        config.ensemble.track_mode = get_or(*ens, "track_mode", config.ensemble.track_mode);
        auto stat_str = get_string_or(*ens, "statistic", "");
        if (!stat_str.empty()) {
            config.ensemble.statistic = parseEnum(stat_str, config.ensemble.statistic, "statistic");
        }
    }

    if (auto bif = tbl["bifurcation"].as_table()) {
        auto& sweep = config.bifurcation.sweep;
        sweep.r_min = get_or(*bif, "r_min", sweep.r_min);
        sweep.r_max = get_or(*bif, "r_max", sweep.r_max);
        sweep.r_count = get_or(*bif, "r_count", sweep.r_count);
        sweep.x_min = get_or(*bif, "x_min", sweep.x_min);
        sweep.x_max = get_or(*bif, "x_max", sweep.x_max);
        sweep.iterations_record = get_or(*bif, "iterations_record", sweep.iterations_record);
        sweep.iterations_discard = get_or(*bif, "iterations_discard", sweep.iterations_discard);
        config.bifurcation.x_bins = get_or(*bif, "x_bins", config.bifurcation.x_bins);
        config.bifurcation.density = get_or(*bif, "density", config.bifurcation.density);
    }

    if (auto cmp = tbl["comparison"].as_table()) {
        auto& c = config.comparison;
        c.r = get_or(*cmp, "r", c.r);
        c.ic_min = get_or(*cmp, "ic_min", c.ic_min);
        c.ic_max = get_or(*cmp, "ic_max", c.ic_max);
        c.ic_count = get_or(*cmp, "ic_count", c.ic_count);
        c.ensemble_size = get_or(*cmp, "ensemble_size", c.ensemble_size);
        c.threshold = get_or(*cmp, "threshold", c.threshold);
        c.steps = get_or(*cmp, "steps", c.steps);
        auto stat_str = get_string_or(*cmp, "statistic", "");
        if (!stat_str.empty()) {
            c.statistic = parseEnum(stat_str, c.statistic, "statistic");
        }
        // scenarios = [{ ic_bias = 1e-6, model_bias = 1e-6 }, ...]
        if (auto scenarios = (*cmp)["scenarios"].as_array()) {
            std::vector<predictability::ScenarioSpec> parsed;
            for (auto const& node : *scenarios) {
                if (auto scen = node.as_table()) {
                    predictability::ScenarioSpec spec;
                    spec.ic_bias = get_or(*scen, "ic_bias", spec.ic_bias);
                    spec.model_bias = get_or(*scen, "model_bias", spec.model_bias);
                    parsed.push_back(spec);
                } else {
                    std::cerr << "Warning: comparison.scenarios entries must be tables, skipping\n";
                }
            }
            if (!parsed.empty()) {
                c.scenarios = std::move(parsed);
            }
        }
    }

    if (auto table = tbl["table"].as_table()) {
        auto& t = config.table;
        t.r_values = get_doubles_or(*table, "r_values", t.r_values);
        t.model_bias_values = get_doubles_or(*table, "model_bias_values", t.model_bias_values);
        t.ic_bias_values = get_doubles_or(*table, "ic_bias_values", t.ic_bias_values);
        t.ensemble_size = get_or(*table, "ensemble_size", t.ensemble_size);
        t.iterations = get_or(*table, "iterations", t.iterations);
        t.threshold = get_or(*table, "threshold", t.threshold);
        if (auto seed = table->get("seed")) {
            if (auto val = seed->value<int64_t>()) {
                t.seed = static_cast<uint64_t>(*val);
            }
        }
        t.thread_count = get_or(*table, "thread_count", t.thread_count);
        t.path = get_string_or(*table, "path", t.path);
    }

    if (auto output = tbl["output"].as_table()) {
        config.output.directory = get_string_or(*output, "directory", config.output.directory);
        auto mode_str = get_string_or(*output, "mode", "");
        if (!mode_str.empty()) {
            config.output.mode = parseEnum(mode_str, config.output.mode, "output mode");
        }
        config.output.save_ensemble =
            get_or(*output, "save_ensemble", config.output.save_ensemble);
    }
}

Config Config::load(std::string const& path) {
    Config config;

    if (!std::filesystem::exists(path)) {
        std::cerr << "Config file not found: " << path << ", using defaults\n";
        return config;
    }

    try {
        auto tbl = toml::parse_file(path);
        std::string base_path = std::filesystem::path(path).parent_path().string();
        if (base_path.empty()) base_path = ".";

        // Process includes first (they provide base values that can be overridden)
        if (auto includes = tbl["include"].as_array()) {
            for (auto const& inc : *includes) {
                if (auto inc_path = inc.value<std::string>()) {
                    std::filesystem::path full_path;
                    if (std::filesystem::path(*inc_path).is_absolute()) {
                        full_path = *inc_path;
                    } else {
                        full_path = std::filesystem::path(base_path) / *inc_path;
                    }
                    if (std::filesystem::exists(full_path)) {
                        try {
                            auto inc_tbl = toml::parse_file(full_path.string());
                            loadConfigFromTable(config, inc_tbl);
                        } catch (toml::parse_error const& err) {
                            std::cerr << "Error parsing included config " << full_path << ": "
                                      << err.description() << "\n";
                        }
                    } else {
                        std::cerr << "Warning: Included config not found: " << full_path << "\n";
                    }
                }
            }
        }

        // Load values from this file (override includes)
        loadConfigFromTable(config, tbl);

    } catch (toml::parse_error const& err) {
        std::cerr << "Error parsing config: " << err.description() << "\n";
        std::cerr << "Using defaults\n";
        return Config{};
    }

    // Minimal validation - only catch obviously broken values
    Config defaults;
    if (config.simulation.steps <= 0) {
        std::cerr << "Warning: steps must be positive, using default ("
                  << defaults.simulation.steps << ")\n";
        config.simulation.steps = defaults.simulation.steps;
    }
    if (config.simulation.error_threshold < 0) {
        std::cerr << "Warning: error_threshold cannot be negative, using default ("
                  << defaults.simulation.error_threshold << ")\n";
        config.simulation.error_threshold = defaults.simulation.error_threshold;
    }
    if (config.ensemble.size <= 0) {
        std::cerr << "Warning: ensemble size must be positive, using default ("
                  << defaults.ensemble.size << ")\n";
        config.ensemble.size = defaults.ensemble.size;
    }
    if (config.ensemble.init_perturbation_sd < 0 || config.ensemble.param_perturbation_sd < 0) {
        std::cerr << "Warning: perturbation standard deviations cannot be negative, using defaults\n";
        config.ensemble.init_perturbation_sd = defaults.ensemble.init_perturbation_sd;
        config.ensemble.param_perturbation_sd = defaults.ensemble.param_perturbation_sd;
    }

    // Bifurcation validation
    auto& sweep = config.bifurcation.sweep;
    auto const& default_sweep = defaults.bifurcation.sweep;
    if (sweep.r_min > sweep.r_max) {
        std::cerr << "Warning: bifurcation r_min > r_max, using defaults\n";
        sweep.r_min = default_sweep.r_min;
        sweep.r_max = default_sweep.r_max;
    }
    if (sweep.x_min > sweep.x_max) {
        std::cerr << "Warning: bifurcation x_min > x_max, using defaults\n";
        sweep.x_min = default_sweep.x_min;
        sweep.x_max = default_sweep.x_max;
    }
    if (sweep.r_count <= 0) {
        std::cerr << "Warning: r_count must be positive, using default (" << default_sweep.r_count
                  << ")\n";
        sweep.r_count = default_sweep.r_count;
    }
    if (config.bifurcation.x_bins <= 0) {
        std::cerr << "Warning: x_bins must be positive, using default ("
                  << defaults.bifurcation.x_bins << ")\n";
        config.bifurcation.x_bins = defaults.bifurcation.x_bins;
    }
    if (sweep.iterations_record < 0 || sweep.iterations_discard < 0) {
        std::cerr << "Warning: bifurcation iteration counts cannot be negative, using defaults\n";
        sweep.iterations_record = default_sweep.iterations_record;
        sweep.iterations_discard = default_sweep.iterations_discard;
    }

    // Comparison validation
    auto& cmp = config.comparison;
    if (cmp.ic_count <= 0 || cmp.ensemble_size <= 0 || cmp.steps <= 0) {
        std::cerr << "Warning: comparison counts must be positive, using defaults\n";
        cmp.ic_count = defaults.comparison.ic_count;
        cmp.ensemble_size = defaults.comparison.ensemble_size;
        cmp.steps = defaults.comparison.steps;
    }
    if (cmp.ic_min > cmp.ic_max) {
        std::cerr << "Warning: comparison ic_min > ic_max, using defaults\n";
        cmp.ic_min = defaults.comparison.ic_min;
        cmp.ic_max = defaults.comparison.ic_max;
    }

    // Table validation
    auto& table = config.table;
    if (table.r_values.empty() || table.model_bias_values.empty() ||
        table.ic_bias_values.empty()) {
        std::cerr << "Warning: table axes cannot be empty, using defaults\n";
        table.r_values = defaults.table.r_values;
        table.model_bias_values = defaults.table.model_bias_values;
        table.ic_bias_values = defaults.table.ic_bias_values;
    }
    if (table.ensemble_size <= 0 || table.iterations <= 0) {
        std::cerr << "Warning: table ensemble_size and iterations must be positive, using defaults\n";
        table.ensemble_size = defaults.table.ensemble_size;
        table.iterations = defaults.table.iterations;
    }
    if (table.thread_count < 0) {
        std::cerr << "Warning: thread_count cannot be negative, using auto\n";
        table.thread_count = 0;
    }

    config.warnOutsideRegime();
    return config;
}

bool Config::applyOverride(std::string const& key, std::string const& value) {
    // Parse dot-notation key (e.g., "ensemble.size")
    auto dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        std::cerr << "Invalid parameter key (missing section): " << key << "\n";
        return false;
    }

    std::string section = key.substr(0, dot_pos);
    std::string param = key.substr(dot_pos + 1);

    try {
        if (section == "truth" || section == "model") {
            StateParams& state = section == "truth" ? truth : model;
            if (param == "r") {
                state.r = std::stod(value);
            } else if (param == "x0") {
                state.x0 = std::stod(value);
            } else {
                std::cerr << "Unknown " << section << " parameter: " << param << "\n";
                return false;
            }
        } else if (section == "simulation") {
            if (param == "steps") {
                simulation.steps = std::stoi(value);
            } else if (param == "error_threshold") {
                simulation.error_threshold = std::stod(value);
            } else if (param == "regime") {
                auto regime = enum_utils::fromString<Regime>(value);
                if (!regime) {
                    std::cerr << "Unknown regime: " << value << "\n";
                    return false;
                }
                applyRegime(*regime);
            } else if (param == "seed") {
                simulation.seed = std::stoull(value);
            } else {
                std::cerr << "Unknown simulation parameter: " << param << "\n";
                return false;
            }
        } else if (section == "ensemble") {
            if (param == "enabled") {
                ensemble.enabled = parseBool(value);
            } else if (param == "size") {
                ensemble.size = std::stoi(value);
            } else if (param == "init_perturbation_sd") {
                ensemble.init_perturbation_sd = std::stod(value);
            } else if (param == "param_perturbation_sd") {
                ensemble.param_perturbation_sd = std::stod(value);
            } else if (param == "track_mode") {
                ensemble.track_mode = parseBool(value);
            } else if (param == "statistic") {
                auto stat = enum_utils::fromString<StatisticKind>(value);
                if (!stat) {
                    std::cerr << "Unknown statistic: " << value << "\n";
                    return false;
                }
                ensemble.statistic = *stat;
            } else {
                std::cerr << "Unknown ensemble parameter: " << param << "\n";
                return false;
            }
        } else if (section == "bifurcation") {
            auto& sweep = bifurcation.sweep;
            if (param == "r_min") {
                sweep.r_min = std::stod(value);
            } else if (param == "r_max") {
                sweep.r_max = std::stod(value);
            } else if (param == "r_count") {
                sweep.r_count = std::stoi(value);
            } else if (param == "x_min") {
                sweep.x_min = std::stod(value);
            } else if (param == "x_max") {
                sweep.x_max = std::stod(value);
            } else if (param == "iterations_record") {
                sweep.iterations_record = std::stoi(value);
            } else if (param == "iterations_discard") {
                sweep.iterations_discard = std::stoi(value);
            } else if (param == "x_bins") {
                bifurcation.x_bins = std::stoi(value);
            } else if (param == "density") {
                bifurcation.density = parseBool(value);
            } else {
                std::cerr << "Unknown bifurcation parameter: " << param << "\n";
                return false;
            }
        } else if (section == "comparison") {
            if (param == "r") {
                comparison.r = std::stod(value);
            } else if (param == "ic_min") {
                comparison.ic_min = std::stod(value);
            } else if (param == "ic_max") {
                comparison.ic_max = std::stod(value);
            } else if (param == "ic_count") {
                comparison.ic_count = std::stoi(value);
            } else if (param == "ensemble_size") {
                comparison.ensemble_size = std::stoi(value);
            } else if (param == "threshold") {
                comparison.threshold = std::stod(value);
            } else if (param == "steps") {
                comparison.steps = std::stoi(value);
            } else if (param == "statistic") {
                auto stat = enum_utils::fromString<StatisticKind>(value);
                if (!stat) {
                    std::cerr << "Unknown statistic: " << value << "\n";
                    return false;
                }
                comparison.statistic = *stat;
            } else {
                std::cerr << "Unknown comparison parameter: " << param << "\n";
                return false;
            }
        } else if (section == "table") {
            if (param == "r_values") {
                table.r_values = parseDoubleList(value);
            } else if (param == "model_bias_values") {
                table.model_bias_values = parseDoubleList(value);
            } else if (param == "ic_bias_values") {
                table.ic_bias_values = parseDoubleList(value);
            } else if (param == "ensemble_size") {
                table.ensemble_size = std::stoi(value);
            } else if (param == "iterations") {
                table.iterations = std::stoi(value);
            } else if (param == "threshold") {
                table.threshold = std::stod(value);
            } else if (param == "seed") {
                table.seed = std::stoull(value);
            } else if (param == "thread_count") {
                table.thread_count = std::stoi(value);
            } else if (param == "path") {
                table.path = value;
            } else {
                std::cerr << "Unknown table parameter: " << param << "\n";
                return false;
            }
        } else if (section == "output") {
            if (param == "directory") {
                output.directory = value;
            } else if (param == "mode") {
                auto mode = enum_utils::fromString<OutputMode>(value);
                if (!mode) {
                    std::cerr << "Unknown output mode: " << value << "\n";
                    return false;
                }
                output.mode = *mode;
            } else if (param == "save_ensemble") {
                output.save_ensemble = parseBool(value);
            } else {
                std::cerr << "Unknown output parameter: " << param << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown section: " << section << "\n";
            return false;
        }
    } catch (std::exception const& e) {
        std::cerr << "Error parsing value for " << key << ": " << e.what() << "\n";
        return false;
    }

    return true;
}

bool Config::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return false;
    }

    file << "[truth]\n";
    file << "r = " << formatDouble(truth.r) << "\n";
    file << "x0 = " << formatDouble(truth.x0) << "\n";
    file << "\n";

    file << "[model]\n";
    file << "r = " << formatDouble(model.r) << "\n";
    file << "x0 = " << formatDouble(model.x0) << "\n";
    file << "\n";

    // Regime is omitted: it would reset truth/model on reload
    file << "[simulation]\n";
    file << "steps = " << simulation.steps << "\n";
    file << "error_threshold = " << formatDouble(simulation.error_threshold) << "\n";
    if (simulation.seed) {
        file << "seed = " << static_cast<int64_t>(*simulation.seed) << "\n";
    }
    file << "\n";

    file << "[ensemble]\n";
    file << "enabled = " << (ensemble.enabled ? "true" : "false") << "\n";
    file << "size = " << ensemble.size << "\n";
    file << "init_perturbation_sd = " << formatDouble(ensemble.init_perturbation_sd) << "\n";
    file << "param_perturbation_sd = " << formatDouble(ensemble.param_perturbation_sd) << "\n";
    file << "statistic = \"" << enum_utils::toString(ensemble.statistic) << "\"\n";
    file << "track_mode = " << (ensemble.track_mode ? "true" : "false") << "\n";
    file << "\n";

    auto const& sweep = bifurcation.sweep;
    file << "[bifurcation]\n";
    file << "r_min = " << formatDouble(sweep.r_min) << "\n";
    file << "r_max = " << formatDouble(sweep.r_max) << "\n";
    file << "r_count = " << sweep.r_count << "\n";
    file << "x_min = " << formatDouble(sweep.x_min) << "\n";
    file << "x_max = " << formatDouble(sweep.x_max) << "\n";
    file << "x_bins = " << bifurcation.x_bins << "\n";
    file << "iterations_record = " << sweep.iterations_record << "\n";
    file << "iterations_discard = " << sweep.iterations_discard << "\n";
    file << "density = " << (bifurcation.density ? "true" : "false") << "\n";
    file << "\n";

    file << "[comparison]\n";
    file << "r = " << formatDouble(comparison.r) << "\n";
    file << "ic_min = " << formatDouble(comparison.ic_min) << "\n";
    file << "ic_max = " << formatDouble(comparison.ic_max) << "\n";
    file << "ic_count = " << comparison.ic_count << "\n";
    file << "ensemble_size = " << comparison.ensemble_size << "\n";
    file << "threshold = " << formatDouble(comparison.threshold) << "\n";
    file << "steps = " << comparison.steps << "\n";
    file << "statistic = \"" << enum_utils::toString(comparison.statistic) << "\"\n";
    file << "scenarios = [\n";
    for (auto const& s : comparison.scenarios) {
        file << "    { ic_bias = " << formatDouble(s.ic_bias)
             << ", model_bias = " << formatDouble(s.model_bias) << " },\n";
    }
    file << "]\n";
    file << "\n";

    file << "[table]\n";
    file << "r_values = " << formatList(table.r_values) << "\n";
    file << "model_bias_values = " << formatList(table.model_bias_values) << "\n";
    file << "ic_bias_values = " << formatList(table.ic_bias_values) << "\n";
    file << "ensemble_size = " << table.ensemble_size << "\n";
    file << "iterations = " << table.iterations << "\n";
    file << "threshold = " << formatDouble(table.threshold) << "\n";
    file << "seed = " << static_cast<int64_t>(table.seed) << "\n";
    file << "thread_count = " << table.thread_count << "\n";
    file << "path = " << quoteString(table.path) << "\n";
    file << "\n";

    file << "[output]\n";
    file << "directory = " << quoteString(output.directory) << "\n";
    file << "mode = \"" << enum_utils::toString(output.mode) << "\"\n";
    file << "save_ensemble = " << (output.save_ensemble ? "true" : "false") << "\n";

    return static_cast<bool>(file);
}
