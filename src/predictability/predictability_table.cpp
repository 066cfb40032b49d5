#include "predictability/predictability_table.h"

#include "enum_utils.h"
#include "predictability/limit_scan.h"
#include "random_stream.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <magic_enum/magic_enum.hpp>
#include <stdexcept>
#include <thread>

namespace predictability {

namespace {

constexpr std::array<StatisticKind, 3> kKinds = {StatisticKind::Mean, StatisticKind::Median,
                                                 StatisticKind::Mode};

size_t kindIndex(StatisticKind kind) {
    return static_cast<size_t>(magic_enum::enum_integer(kind));
}

std::vector<double> readAxis(nlohmann::json const& j, char const* key) {
    if (!j.contains(key) || !j[key].is_array()) {
        throw std::runtime_error(std::string("predictability table: missing axis '") + key + "'");
    }
    auto values = j[key].get<std::vector<double>>();
    if (values.empty()) {
        throw std::runtime_error(std::string("predictability table: empty axis '") + key + "'");
    }
    return values;
}

} // namespace

PredictabilityTable::PredictabilityTable(TableAxes axes) : axes_(std::move(axes)) {
    for (auto& surface : surfaces_) {
        surface.assign(axes_.cellCount(), 0);
    }
}

size_t PredictabilityTable::offset(size_t r_index, size_t model_bias_index,
                                   size_t ic_index) const {
    if (r_index >= axes_.r_values.size() || model_bias_index >= axes_.model_bias_values.size() ||
        ic_index >= axes_.ic_bias_values.size()) {
        throw std::out_of_range("predictability table: index outside the axes");
    }
    size_t const n_model = axes_.model_bias_values.size();
    size_t const n_ic = axes_.ic_bias_values.size();
    return (r_index * n_model + model_bias_index) * n_ic + ic_index;
}

int PredictabilityTable::at(StatisticKind kind, size_t r_index, size_t model_bias_index,
                            size_t ic_index) const {
    return surfaces_[kindIndex(kind)][offset(r_index, model_bias_index, ic_index)];
}

void PredictabilityTable::set(StatisticKind kind, size_t r_index, size_t model_bias_index,
                              size_t ic_index, int limit) {
    surfaces_[kindIndex(kind)][offset(r_index, model_bias_index, ic_index)] = limit;
}

LimitRow PredictabilityTable::row(size_t r_index, size_t model_bias_index) const {
    size_t const n_ic = axes_.ic_bias_values.size();
    size_t const first = offset(r_index, model_bias_index, 0);

    auto slice = [&](StatisticKind kind) {
        auto const& surface = surfaces_[kindIndex(kind)];
        return std::vector<int>(surface.begin() + static_cast<std::ptrdiff_t>(first),
                                surface.begin() + static_cast<std::ptrdiff_t>(first + n_ic));
    };

    LimitRow result;
    result.mean = slice(StatisticKind::Mean);
    result.median = slice(StatisticKind::Median);
    result.mode = slice(StatisticKind::Mode);
    return result;
}

int PredictabilityTable::lookup(double r, double model_bias, double ic_bias,
                                StatisticKind kind) const {
    return at(kind, nearestIndex(axes_.r_values, r),
              nearestIndex(axes_.model_bias_values, model_bias),
              nearestIndex(axes_.ic_bias_values, ic_bias));
}

PredictabilityTable PredictabilityTable::fromJSON(nlohmann::json const& j) {
    PredictabilityTable table(TableAxes{readAxis(j, "r_values"), readAxis(j, "model_bias_values"),
                                        readAxis(j, "ic_bias_values")});
    TableAxes const& axes = table.axes_;

    if (!j.contains("surfaces") || !j["surfaces"].is_object()) {
        throw std::runtime_error("predictability table: missing 'surfaces'");
    }
    auto const& surfaces = j["surfaces"];

    for (StatisticKind kind : kKinds) {
        std::string const name = enum_utils::toString(kind);
        if (!surfaces.contains(name)) {
            throw std::runtime_error("predictability table: missing surface '" + name + "'");
        }
        auto const& surface = surfaces[name];
        if (!surface.is_array() || surface.size() != axes.r_values.size()) {
            throw std::runtime_error("predictability table: surface '" + name +
                                     "' does not match r_values");
        }
        for (size_t i = 0; i < surface.size(); ++i) {
            auto const& plane = surface[i];
            if (!plane.is_array() || plane.size() != axes.model_bias_values.size()) {
                throw std::runtime_error("predictability table: surface '" + name +
                                         "' does not match model_bias_values");
            }
            for (size_t m = 0; m < plane.size(); ++m) {
                auto const& limits = plane[m];
                if (!limits.is_array() || limits.size() != axes.ic_bias_values.size()) {
                    throw std::runtime_error("predictability table: surface '" + name +
                                             "' does not match ic_bias_values");
                }
                for (size_t k = 0; k < limits.size(); ++k) {
                    table.set(kind, i, m, k, limits[k].get<int>());
                }
            }
        }
    }
    return table;
}

PredictabilityTable PredictabilityTable::load(std::string const& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("predictability table: cannot read " + path);
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (nlohmann::json::parse_error const& e) {
        throw std::runtime_error("predictability table: invalid JSON in " + path + ": " +
                                 e.what());
    }

    try {
        return fromJSON(root);
    } catch (nlohmann::json::exception const& e) {
        throw std::runtime_error("predictability table: bad value in " + path + ": " + e.what());
    }
}

nlohmann::json PredictabilityTable::toJSON() const {
    nlohmann::json j;
    j["r_values"] = axes_.r_values;
    j["model_bias_values"] = axes_.model_bias_values;
    j["ic_bias_values"] = axes_.ic_bias_values;

    nlohmann::json surfaces = nlohmann::json::object();
    for (StatisticKind kind : kKinds) {
        nlohmann::json surface = nlohmann::json::array();
        for (size_t i = 0; i < axes_.r_values.size(); ++i) {
            nlohmann::json plane = nlohmann::json::array();
            for (size_t m = 0; m < axes_.model_bias_values.size(); ++m) {
                plane.push_back(row(i, m).get(kind));
            }
            surface.push_back(plane);
        }
        surfaces[enum_utils::toString(kind)] = surface;
    }
    j["surfaces"] = surfaces;
    return j;
}

bool PredictabilityTable::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: Cannot write to " << path << "\n";
        return false;
    }
    file << toJSON().dump(2) << "\n";
    return static_cast<bool>(file);
}

size_t nearestIndex(std::vector<double> const& axis, double value) {
    if (axis.empty()) {
        throw std::invalid_argument("nearestIndex: empty axis");
    }

    // Bias axes are log-spaced; an axis holding 0 (or a non-positive query) snaps linearly
    bool const log_scale = value > 0.0 && std::all_of(axis.begin(), axis.end(),
                                                      [](double v) { return v > 0.0; });
    auto distance = [&](double v) {
        return log_scale ? std::abs(std::log10(v) - std::log10(value)) : std::abs(v - value);
    };

    size_t best = 0;
    double best_dist = distance(axis[0]);
    for (size_t i = 1; i < axis.size(); ++i) {
        double dist = distance(axis[i]);
        if (dist < best_dist) {
            best = i;
            best_dist = dist;
        }
    }
    return best;
}

PredictabilityTable generateTable(TableSpec const& spec, uint64_t seed, int thread_count,
                                  ProgressCallback progress) {
    PredictabilityTable table(spec.axes);

    size_t const n_model = spec.axes.model_bias_values.size();
    size_t const n_ic = spec.axes.ic_bias_values.size();
    size_t const cells_per_kind = spec.axes.cellCount();
    size_t const total = cells_per_kind * kKinds.size();
    if (total == 0) {
        return table;
    }

    unsigned int num_threads = thread_count > 0 ? static_cast<unsigned int>(thread_count)
                                                : std::thread::hardware_concurrency();
    if (num_threads == 0) num_threads = 4;
    num_threads = static_cast<unsigned int>(std::min<size_t>(num_threads, total));

    std::atomic<size_t> work_idx{0};
    std::atomic<size_t> completed{0};
    std::atomic<bool> done{false};

    // Progress is reported from one thread only
    std::thread progress_thread;
    if (progress) {
        progress_thread = std::thread([&]() {
            while (!done.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                progress(static_cast<int>(completed.load()), static_cast<int>(total));
            }
        });
    }

    // Workers write disjoint cells, so the surfaces need no lock
    std::vector<std::thread> workers;
    for (unsigned int t = 0; t < num_threads; ++t) {
        workers.emplace_back([&]() {
            while (true) {
                size_t idx = work_idx.fetch_add(1);
                if (idx >= total) break;

                StatisticKind kind = kKinds[idx / cells_per_kind];
                size_t cell = idx % cells_per_kind;
                size_t r_i = cell / (n_model * n_ic);
                size_t m_i = (cell / n_ic) % n_model;
                size_t ic_i = cell % n_ic;

                LimitScanParams params;
                params.r = spec.axes.r_values[r_i];
                params.model_bias = spec.axes.model_bias_values[m_i];
                params.ic_bias = spec.axes.ic_bias_values[ic_i];
                params.ensemble_size = spec.ensemble_size;
                params.iterations = spec.iterations;
                params.threshold = spec.threshold;
                params.metric = kind;

                RandomEngine rng = deriveEngine(seed, idx);
                table.set(kind, r_i, m_i, ic_i, singleScenarioPredictabilityLimit(params, rng));
                completed.fetch_add(1);
            }
        });
    }

    for (auto& w : workers) {
        w.join();
    }

    done.store(true);
    if (progress_thread.joinable()) {
        progress_thread.join();
    }
    if (progress) {
        progress(static_cast<int>(total), static_cast<int>(total));
    }
    return table;
}

} // namespace predictability
