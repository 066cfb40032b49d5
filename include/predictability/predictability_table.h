#pragma once

#include "predictability/predictability_analyzer.h"
#include "statistic_kind.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace predictability {

struct TableAxes {
    std::vector<double> r_values;
    std::vector<double> model_bias_values;
    std::vector<double> ic_bias_values;

    size_t cellCount() const {
        return r_values.size() * model_bias_values.size() * ic_bias_values.size();
    }
};

// Limit scan settings shared by every cell
struct TableSpec {
    TableAxes axes;
    int ensemble_size = 50;
    int iterations = 1000;
    double threshold = 0.1;
};

// Limits along the ic-bias axis for one (r, model_bias) pair
struct LimitRow {
    std::vector<int> mean;
    std::vector<int> median;
    std::vector<int> mode;

    std::vector<int> const& get(StatisticKind kind) const {
        switch (kind) {
        case StatisticKind::Mean:
            return mean;
        case StatisticKind::Median:
            return median;
        case StatisticKind::Mode:
            return mode;
        }
        return mean;
    }
};

// Precomputed predictability limits, one dense [r][model_bias][ic_bias]
// surface per statistic
class PredictabilityTable {
public:
    PredictabilityTable() = default;
    explicit PredictabilityTable(TableAxes axes);

    // Throws std::runtime_error on a missing file, bad JSON or mismatched shapes
    static PredictabilityTable load(std::string const& path);
    static PredictabilityTable fromJSON(nlohmann::json const& j);

    bool save(std::string const& path) const;
    nlohmann::json toJSON() const;

    TableAxes const& axes() const { return axes_; }
    bool empty() const { return axes_.cellCount() == 0; }

    int at(StatisticKind kind, size_t r_index, size_t model_bias_index, size_t ic_index) const;
    void set(StatisticKind kind, size_t r_index, size_t model_bias_index, size_t ic_index,
             int limit);

    // Throws std::out_of_range for indices outside the axes
    LimitRow row(size_t r_index, size_t model_bias_index) const;

    // Limit at the grid point nearest to (r, model_bias, ic_bias)
    int lookup(double r, double model_bias, double ic_bias, StatisticKind kind) const;

private:
    size_t offset(size_t r_index, size_t model_bias_index, size_t ic_index) const;

    TableAxes axes_;
    std::array<std::vector<int>, 3> surfaces_; // indexed by StatisticKind
};

// Index of the axis value closest to value (first one on ties). Distances are
// taken in log10 when the axis and value are strictly positive, linearly
// otherwise. Throws std::invalid_argument on an empty axis.
size_t nearestIndex(std::vector<double> const& axis, double value);

// Run the limit scan for every (statistic, r, model_bias, ic_bias) cell.
// Each cell draws from deriveEngine(seed, cell), so the table is the same for
// any thread_count. thread_count <= 0 uses hardware_concurrency().
PredictabilityTable generateTable(TableSpec const& spec, uint64_t seed, int thread_count,
                                  ProgressCallback progress = nullptr);

} // namespace predictability
