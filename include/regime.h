#pragma once

#include <array>

// Named dynamical regimes and their front-end slider bounds/defaults.
// Read-only configuration, not derived from simulation.
enum class Regime { Chaotic, SingleValued, Periodic };

struct SliderRange {
    double min = 0.0;
    double max = 1.0;

    bool contains(double v) const { return v >= min && v <= max; }
};

struct RegimeDefaults {
    Regime regime;
    char const* label;
    SliderRange param_limits; // r
    double param_value;
    SliderRange init_limits; // x0
    double init_value;
};

inline constexpr std::array<RegimeDefaults, 3> kRegimeDefaults = {{
    {Regime::Chaotic, "Chaotic", {3.6, 4.0}, 3.75, {0.0, 1.0}, 0.25},
    {Regime::SingleValued, "Deterministic (Single-Valued)", {0.0, 3.0}, 1.5, {0.0, 1.0}, 0.5},
    {Regime::Periodic, "Deterministic (Periodic)", {3.0, 3.56}, 3.1, {0.0, 1.0}, 0.5},
}};

constexpr RegimeDefaults const& regimeDefaults(Regime regime) {
    switch (regime) {
    case Regime::Chaotic:
        return kRegimeDefaults[0];
    case Regime::SingleValued:
        return kRegimeDefaults[1];
    case Regime::Periodic:
        return kRegimeDefaults[2];
    }
    return kRegimeDefaults[0];
}
