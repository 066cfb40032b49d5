#pragma once

#include "random_stream.h"
#include "statistic_kind.h"
#include "stats/central_tendency.h"
#include "trajectory.h"

#include <cstddef>
#include <vector>

// Every member's trajectory, indexed by (member, step). Row-major by member.
class EnsembleMatrix {
public:
    EnsembleMatrix() = default;
    EnsembleMatrix(int members, int steps)
        : members_(members), steps_(steps), data_(static_cast<size_t>(members) * steps, 0.0) {}

    int members() const { return members_; }
    int steps() const { return steps_; }

    double at(int member, int step) const { return data_[index(member, step)]; }
    void set(int member, int step, double value) { data_[index(member, step)] = value; }

    // Row: one member's trajectory
    Trajectory member(int m) const {
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(index(m, 0));
        return Trajectory(first, first + steps_);
    }

    // Column: the whole ensemble at one step
    std::vector<double> column(int step) const {
        std::vector<double> out(members_);
        for (int m = 0; m < members_; ++m) {
            out[m] = at(m, step);
        }
        return out;
    }

    std::vector<double> const& data() const { return data_; }

private:
    size_t index(int member, int step) const {
        return static_cast<size_t>(member) * steps_ + step;
    }

    int members_ = 0;
    int steps_ = 0;
    std::vector<double> data_;
};

// Per-step aggregate statistics, one entry per step
struct EnsembleStatisticsSeries {
    std::vector<double> mean;
    std::vector<double> median;
    std::vector<double> mode; // empty unless mode tracking ran
    std::vector<double> stddev;
    std::vector<double> p10;
    std::vector<double> p90;
    std::vector<double> min;
    std::vector<double> max;
    std::vector<stats::ModeSource> mode_sources;

    bool hasMode() const { return mode.size() == mean.size(); }
    size_t size() const { return mean.size(); }
};

// Trajectories started from the initial ensemble mean/median/mode and stepped
// with the nominal model parameter
struct DeterministicTrajectorySet {
    Trajectory from_mean;
    Trajectory from_median;
    Trajectory from_mode;

    Trajectory const& get(StatisticKind kind) const {
        switch (kind) {
        case StatisticKind::Mean:
            return from_mean;
        case StatisticKind::Median:
            return from_median;
        case StatisticKind::Mode:
            return from_mode;
        }
        return from_mean;
    }
};

struct EnsembleParams {
    double x0_model = 0.25;
    double r_model = 3.75;
    int steps = 50;
    int member_count = 50;
    double init_perturbation_sd = 0.0;
    double param_perturbation_sd = 0.0;
    bool track_mode = true; // the density-based mode dominates runtime
};

struct EnsembleRun {
    EnsembleMatrix matrix;
    EnsembleStatisticsSeries statistics;
    DeterministicTrajectorySet companions;
    stats::CentralTendency initial; // of the perturbed initial conditions

    // Per-member draws, fixed for the whole run
    std::vector<double> member_x0;
    std::vector<double> member_r;

    // Fill statistics.mode if the run skipped mode tracking
    void ensureModeSeries();
};

// Perturb, then step every member in lock-step for params.steps iterations.
// The matrix always has exactly member_count rows and steps columns.
EnsembleRun runEnsemble(EnsembleParams const& params, RandomEngine& rng);

// Per-step statistics over the matrix columns
EnsembleStatisticsSeries computeStatistics(EnsembleMatrix const& matrix, bool track_mode);

void computeModeSeries(EnsembleMatrix const& matrix, EnsembleStatisticsSeries& series);

std::vector<double> const& selectSeries(EnsembleStatisticsSeries const& series, StatisticKind kind);
