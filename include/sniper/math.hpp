// Sniper Taker Engine - Statistics
// Helpers behind the valuation models

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sniper::math {

double mean(const std::vector<double>& data) noexcept;

// Sample variance (n - 1)
double variance(const std::vector<double>& data) noexcept;

// Sample covariance (n - 1)
double covariance(
    const std::vector<double>& x,
    const std::vector<double>& y) noexcept;

double median(std::vector<double> data) noexcept;

// Least-squares fit of x[t+1] = intercept + slope * x[t]
struct Ar1Fit {
    double intercept = 0.0;
    double slope = 0.0;
    double residual_variance = 0.0;
    size_t samples = 0;
};

// Needs at least 3 points; a flat series yields slope 0 and intercept = level
Ar1Fit fit_ar1(const std::vector<double>& series) noexcept;

inline double clamp_probability(double p) noexcept {
    return p < 0.0 ? 0.0 : (p > 1.0 ? 1.0 : p);
}

}  // namespace sniper::math
