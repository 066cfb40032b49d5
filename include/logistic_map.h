#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

// Logistic map x -> r*x*(1-x)
//
// No bounds checking: r outside [0,4] or x outside [0,1] are accepted and the
// values are allowed to leave [0,1] or become non-finite.
namespace logistic {

inline double step(double x, double r) {
    return r * x * (1.0 - x);
}

// Scalar r broadcast across every state (bifurcation-style sweep with fixed r)
inline void stepInPlace(std::vector<double>& xs, double r) {
    for (double& x : xs) {
        x = step(x, r);
    }
}

// Element-wise: xs[i] advances with its own rs[i]
inline void stepInPlace(std::vector<double>& xs, std::vector<double> const& rs) {
    if (xs.size() != rs.size()) {
        throw std::invalid_argument("logistic::stepInPlace: state and parameter sizes differ");
    }
    size_t const n = xs.size();
    for (size_t i = 0; i < n; ++i) {
        xs[i] = step(xs[i], rs[i]);
    }
}

inline std::vector<double> step(std::vector<double> xs, double r) {
    stepInPlace(xs, r);
    return xs;
}

inline std::vector<double> step(std::vector<double> xs, std::vector<double> const& rs) {
    stepInPlace(xs, rs);
    return xs;
}

// Attracting fixed point for r in (1,3)
inline double fixedPoint(double r) {
    return (r - 1.0) / r;
}

} // namespace logistic
