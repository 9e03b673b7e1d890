// SPDX-License-Identifier: MIT
/**
 * @file statistics.hpp
 * @brief Sample statistics over contiguous series
 *
 * Conventions match the estimators used throughout the evaluation layer:
 * `variance` / `stddev` are population moments (divide by n), while
 * `sample_covariance` divides by n-1.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <span>
#include <vector>

namespace hedgelab::stats {

/// Arithmetic mean, 0 for an empty series
inline double mean(std::span<const double> x) {
    if (x.empty()) return 0.0;
    return std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
}

/// Population variance (denominator n), 0 for an empty series
inline double variance(std::span<const double> x) {
    if (x.empty()) return 0.0;
    double m = mean(x);
    double acc = 0.0;
    for (double v : x) {
        acc += (v - m) * (v - m);
    }
    return acc / static_cast<double>(x.size());
}

/// Population standard deviation
inline double stddev(std::span<const double> x) {
    return std::sqrt(variance(x));
}

/// Unbiased sample covariance (denominator n-1)
///
/// Requires x.size() == y.size() >= 2; returns NaN otherwise.
inline double sample_covariance(std::span<const double> x, std::span<const double> y) {
    const size_t n = x.size();
    if (n < 2 || y.size() != n) {
        return std::nan("");
    }
    double mx = mean(x);
    double my = mean(y);
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        acc += (x[i] - mx) * (y[i] - my);
    }
    return acc / static_cast<double>(n - 1);
}

/// Percentile with linear interpolation between closest ranks
///
/// @param q Percentile in [0, 100]
inline double percentile(std::span<const double> x, double q) {
    if (x.empty()) return std::nan("");
    std::vector<double> sorted(x.begin(), x.end());
    std::sort(sorted.begin(), sorted.end());
    double rank = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = static_cast<size_t>(std::ceil(rank));
    double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

/// Simple period-over-period returns: r[i] = (x[i+1] - x[i]) / x[i]
inline std::vector<double> simple_returns(std::span<const double> x) {
    std::vector<double> out;
    if (x.size() < 2) return out;
    out.reserve(x.size() - 1);
    for (size_t i = 0; i + 1 < x.size(); ++i) {
        out.push_back((x[i + 1] - x[i]) / x[i]);
    }
    return out;
}

}  // namespace hedgelab::stats
