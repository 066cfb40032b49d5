#include "results_io.h"

#include "enum_utils.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace results_io {

namespace {

std::ofstream openCSV(std::string const& path) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
    }
    out << std::setprecision(12);
    return out;
}

// Value at t, empty cell past the end
void writeCell(std::ostream& out, std::vector<double> const& series, size_t t) {
    out << ",";
    if (t < series.size()) {
        out << series[t];
    }
}

} // namespace

std::string createRunDirectory(OutputParams const& output) {
    std::string path;

    if (output.mode == OutputMode::Direct) {
        path = output.directory;
    } else {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&time);

        std::ostringstream dir_name;
        dir_name << output.directory << "/run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
        path = dir_name.str();
    }

    std::filesystem::create_directories(path);
    return path;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time);
    std::ostringstream time_str;
    time_str << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return time_str.str();
}

bool writeJSON(std::string const& path, nlohmann::json const& j) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return false;
    }
    out << j.dump(2) << "\n";
    return static_cast<bool>(out);
}

nlohmann::json toJSON(SimulationRequest const& request) {
    nlohmann::json j;
    j["truth"] = {{"r", request.truth.r}, {"x0", request.truth.x0}};
    j["model"] = {{"r", request.model.r}, {"x0", request.model.x0}};
    j["steps"] = request.steps;
    j["error_threshold"] = request.error_threshold;
    j["ensemble"] = {{"enabled", request.ensemble_enabled},
                     {"size", request.ensemble_size},
                     {"init_perturbation_sd", request.init_perturbation_sd},
                     {"param_perturbation_sd", request.param_perturbation_sd},
                     {"statistic", enum_utils::toString(request.statistic)}};
    return j;
}

nlohmann::json toJSON(SimulationResults const& results) {
    nlohmann::json j;
    j["statistic"] = enum_utils::toString(results.statistic);
    j["threshold"] = results.threshold;
    j["steps"] = results.truth.size();
    j["predictability_index"] = results.prediction.index;
    j["exceeded"] = results.prediction.exceeded();
    if (results.prediction.exceeded()) {
        j["error_at_crossing"] = results.prediction.abs_error[results.prediction.index];
    } else {
        j["error_at_crossing"] = nullptr;
    }

    if (results.ensemble) {
        auto const& initial = results.ensemble->initial;
        j["initial"] = {{"mean", initial.mean},
                        {"median", initial.median},
                        {"mode", initial.mode},
                        {"mode_source", enum_utils::toString(initial.mode_source)}};

        // How often the mode estimate fell back per branch
        std::map<std::string, int> sources;
        for (auto source : magic_enum::enum_values<stats::ModeSource>()) {
            sources[enum_utils::toString(source)] = 0;
        }
        for (auto source : results.ensemble->statistics.mode_sources) {
            ++sources[enum_utils::toString(source)];
        }
        j["mode_sources"] = sources;
    }

    j["timing"] = {{"total_seconds", results.timing.total_seconds},
                   {"ensemble_seconds", results.timing.ensemble_seconds}};
    return j;
}

nlohmann::json toJSON(bifurcation::SweepParams const& params) {
    return {{"r_min", params.r_min},
            {"r_max", params.r_max},
            {"r_count", params.r_count},
            {"x_min", params.x_min},
            {"x_max", params.x_max},
            {"iterations_discard", params.iterations_discard},
            {"iterations_record", params.iterations_record}};
}

nlohmann::json toJSON(predictability::ComparisonResult const& result) {
    nlohmann::json j;
    j["ic_values"] = result.ic_values;
    nlohmann::json scenarios = nlohmann::json::array();
    for (size_t i = 0; i < result.curves.size(); ++i) {
        auto const& curve = result.curves[i];
        scenarios.push_back({{"ic_bias", curve.scenario.ic_bias},
                             {"model_bias", curve.scenario.model_bias},
                             {"reference", i == 0},
                             {"predictability_index", curve.index}});
    }
    j["scenarios"] = scenarios;
    j["computation_seconds"] = result.computation_seconds;
    return j;
}

bool writeSimulationCSV(std::string const& dir, SimulationResults const& results,
                        bool save_ensemble) {
    bool ok = true;
    size_t const steps = results.truth.size();
    EnsembleRun const* ens = results.ensemble ? &*results.ensemble : nullptr;

    {
        auto out = openCSV(dir + "/trajectories.csv");
        if (!out) {
            return false;
        }
        out << "step,truth,model_det,selected,abs_error";
        if (ens) {
            out << ",mean,median,mode,stddev,p10,p90,min,max"
                << ",det_from_mean,det_from_median,det_from_mode";
        }
        out << "\n";

        for (size_t t = 0; t < steps; ++t) {
            out << t;
            writeCell(out, results.truth, t);
            writeCell(out, results.model_det, t);
            writeCell(out, results.selected, t);
            writeCell(out, results.prediction.abs_error, t);
            if (ens) {
                auto const& s = ens->statistics;
                writeCell(out, s.mean, t);
                writeCell(out, s.median, t);
                writeCell(out, s.mode, t);
                writeCell(out, s.stddev, t);
                writeCell(out, s.p10, t);
                writeCell(out, s.p90, t);
                writeCell(out, s.min, t);
                writeCell(out, s.max, t);
                writeCell(out, ens->companions.from_mean, t);
                writeCell(out, ens->companions.from_median, t);
                writeCell(out, ens->companions.from_mode, t);
            }
            out << "\n";
        }
        ok = ok && static_cast<bool>(out);
    }

    if (results.error_bounds) {
        auto out = openCSV(dir + "/error_bounds.csv");
        if (!out) {
            return false;
        }
        predictability::ErrorBounds const b = results.error_bounds->clippedForLog();
        out << "step,p10,p90,min,max\n";
        for (size_t t = 0; t < b.size(); ++t) {
            out << t << "," << b.p10[t] << "," << b.p90[t] << "," << b.min[t] << "," << b.max[t]
                << "\n";
        }
        ok = ok && static_cast<bool>(out);
    }

    if (ens && save_ensemble) {
        auto out = openCSV(dir + "/ensemble.csv");
        if (!out) {
            return false;
        }
        // One row per member: r, x0, then the trajectory
        out << "member,r,x0";
        for (int t = 0; t < ens->matrix.steps(); ++t) {
            out << ",t" << t;
        }
        out << "\n";
        for (int m = 0; m < ens->matrix.members(); ++m) {
            out << m << "," << ens->member_r[m] << "," << ens->member_x0[m];
            for (int t = 0; t < ens->matrix.steps(); ++t) {
                out << "," << ens->matrix.at(m, t);
            }
            out << "\n";
        }
        ok = ok && static_cast<bool>(out);
    }

    return ok;
}

bool writeCloudCSV(std::string const& path, bifurcation::BifurcationCloud const& cloud) {
    auto out = openCSV(path);
    if (!out) {
        return false;
    }
    out << "r,x\n";
    for (size_t i = 0; i < cloud.size(); ++i) {
        out << cloud.r[i] << "," << cloud.x[i] << "\n";
    }
    return static_cast<bool>(out);
}

bool writeDensityCSV(std::string const& path, bifurcation::DensityGrid const& grid) {
    auto out = openCSV(path);
    if (!out) {
        return false;
    }
    // Header holds the r-bin lower edges; first column the x-bin lower edge
    out << "x_edge";
    for (int rb = 0; rb < grid.r_bins; ++rb) {
        out << "," << grid.r_edges[rb];
    }
    out << "\n";
    for (int xb = 0; xb < grid.x_bins; ++xb) {
        out << grid.x_edges[xb];
        for (int rb = 0; rb < grid.r_bins; ++rb) {
            out << "," << grid.at(xb, rb);
        }
        out << "\n";
    }
    return static_cast<bool>(out);
}

bool writeComparisonCSV(std::string const& path, predictability::ComparisonResult const& result) {
    auto out = openCSV(path);
    if (!out) {
        return false;
    }
    out << "step,normalized_threshold";
    for (size_t i = 0; i < result.curves.size(); ++i) {
        out << ",s" << i << "_error,s" << i << "_p10,s" << i << "_p90,s" << i << "_normalized";
    }
    out << "\n";

    for (size_t t = 0; t < result.normalized_threshold.size(); ++t) {
        out << t << "," << result.normalized_threshold[t];
        for (auto const& curve : result.curves) {
            writeCell(out, curve.error, t);
            writeCell(out, curve.error_p10, t);
            writeCell(out, curve.error_p90, t);
            writeCell(out, curve.normalized, t);
        }
        out << "\n";
    }
    return static_cast<bool>(out);
}

} // namespace results_io
