#pragma once

#include "bifurcation.h"
#include "config.h"
#include "predictability/scenario_comparison.h"
#include "simulation.h"

#include <nlohmann/json.hpp>
#include <string>

// Run directories, results.json and CSV exports. Writers return false (and log
// to stderr) when a file cannot be written.
namespace results_io {

// output/run_YYYYMMDD_HHMMSS, or output.directory itself in Direct mode
std::string createRunDirectory(OutputParams const& output);

// ISO-8601 local time
std::string timestamp();

bool writeJSON(std::string const& path, nlohmann::json const& j);

nlohmann::json toJSON(SimulationRequest const& request);
nlohmann::json toJSON(SimulationResults const& results);
nlohmann::json toJSON(bifurcation::SweepParams const& params);
nlohmann::json toJSON(predictability::ComparisonResult const& result);

// trajectories.csv, error_bounds.csv and (optionally) ensemble.csv
bool writeSimulationCSV(std::string const& dir, SimulationResults const& results,
                        bool save_ensemble);

// bifurcation.csv (r, x)
bool writeCloudCSV(std::string const& path, bifurcation::BifurcationCloud const& cloud);

// density.csv, one row per x bin
bool writeDensityCSV(std::string const& path, bifurcation::DensityGrid const& grid);

// comparison.csv, one row per step
bool writeComparisonCSV(std::string const& path, predictability::ComparisonResult const& result);

} // namespace results_io
