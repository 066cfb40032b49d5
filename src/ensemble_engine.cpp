#include "ensemble_engine.h"

#include "logistic_map.h"
#include "stats/descriptive.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

struct ColumnSummary {
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;
    double p10 = 0.0;
    double p90 = 0.0;
    double min = 0.0;
    double max = 0.0;
};

// One sort per column serves median, percentiles and extremes
ColumnSummary summarizeColumn(std::vector<double> column) {
    ColumnSummary s;
    if (column.empty()) {
        return s;
    }
    s.mean = stats::mean(column);
    s.stddev = stats::stddev(column);

    bool has_nan = std::any_of(column.begin(), column.end(), [](double v) { return std::isnan(v); });
    if (has_nan) {
        double const nan = std::numeric_limits<double>::quiet_NaN();
        s.median = s.p10 = s.p90 = s.min = s.max = nan;
        return s;
    }

    std::sort(column.begin(), column.end());
    s.median = stats::percentileSorted(column, 50.0);
    s.p10 = stats::percentileSorted(column, 10.0);
    s.p90 = stats::percentileSorted(column, 90.0);
    s.min = column.front();
    s.max = column.back();
    return s;
}

} // namespace

void EnsembleRun::ensureModeSeries() {
    if (!statistics.hasMode()) {
        computeModeSeries(matrix, statistics);
    }
}

EnsembleRun runEnsemble(EnsembleParams const& params, RandomEngine& rng) {
    int const n = std::max(0, params.member_count);
    int const steps = std::max(0, params.steps);

    EnsembleRun run;
    run.matrix = EnsembleMatrix(n, steps);

    // Parameter draws first, then initial conditions
    run.member_r.resize(n);
    run.member_x0.resize(n);
    for (int i = 0; i < n; ++i) {
        run.member_r[i] = params.r_model + standardNormal(rng) * params.param_perturbation_sd;
    }
    for (int i = 0; i < n; ++i) {
        run.member_x0[i] = params.x0_model + standardNormal(rng) * params.init_perturbation_sd;
    }

    run.initial = stats::estimate(run.member_x0);

    run.companions.from_mean.resize(steps);
    run.companions.from_median.resize(steps);
    run.companions.from_mode.resize(steps);

    std::vector<double> x = run.member_x0;
    double xm = run.initial.mean;
    double xmed = run.initial.median;
    double xmod = run.initial.mode;

    // Time is sequential; each iteration advances all members at once
    for (int t = 0; t < steps; ++t) {
        for (int m = 0; m < n; ++m) {
            run.matrix.set(m, t, x[m]);
        }
        run.companions.from_mean[t] = xm;
        run.companions.from_median[t] = xmed;
        run.companions.from_mode[t] = xmod;

        logistic::stepInPlace(x, run.member_r);
        xm = logistic::step(xm, params.r_model);
        xmed = logistic::step(xmed, params.r_model);
        xmod = logistic::step(xmod, params.r_model);
    }

    run.statistics = computeStatistics(run.matrix, params.track_mode);
    return run;
}

EnsembleStatisticsSeries computeStatistics(EnsembleMatrix const& matrix, bool track_mode) {
    int const steps = matrix.steps();

    EnsembleStatisticsSeries series;
    series.mean.resize(steps);
    series.median.resize(steps);
    series.stddev.resize(steps);
    series.p10.resize(steps);
    series.p90.resize(steps);
    series.min.resize(steps);
    series.max.resize(steps);

    for (int t = 0; t < steps; ++t) {
        ColumnSummary s = summarizeColumn(matrix.column(t));
        series.mean[t] = s.mean;
        series.median[t] = s.median;
        series.stddev[t] = s.stddev;
        series.p10[t] = s.p10;
        series.p90[t] = s.p90;
        series.min[t] = s.min;
        series.max[t] = s.max;
    }

    if (track_mode) {
        computeModeSeries(matrix, series);
    }
    return series;
}

void computeModeSeries(EnsembleMatrix const& matrix, EnsembleStatisticsSeries& series) {
    int const steps = matrix.steps();
    series.mode.resize(steps);
    series.mode_sources.resize(steps);

    for (int t = 0; t < steps; ++t) {
        stats::ModeEstimate est = stats::estimateMode(matrix.column(t));
        series.mode[t] = est.value;
        series.mode_sources[t] = est.source;
    }
}

std::vector<double> const& selectSeries(EnsembleStatisticsSeries const& series, StatisticKind kind) {
    switch (kind) {
    case StatisticKind::Mean:
        return series.mean;
    case StatisticKind::Median:
        return series.median;
    case StatisticKind::Mode:
        return series.mode;
    }
    return series.mean;
}
