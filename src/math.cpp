// Sniper Taker Engine - Statistics Implementation

#include <sniper/math.hpp>
#include <algorithm>
#include <numeric>

namespace sniper::math {

double mean(const std::vector<double>& data) noexcept {
    if (data.empty()) return 0.0;
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double>& data) noexcept {
    return covariance(data, data);
}

double covariance(const std::vector<double>& x, const std::vector<double>& y) noexcept {
    if (x.size() != y.size() || x.size() < 2) return 0.0;

    size_t n = x.size();

    double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / n;
    double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double cov = 0.0;
    for (size_t i = 0; i < n; ++i) {
        cov += (x[i] - mean_x) * (y[i] - mean_y);
    }

    return cov / (n - 1);
}

double median(std::vector<double> data) noexcept {
    if (data.empty()) return 0.0;
    size_t mid = data.size() / 2;
    std::nth_element(data.begin(), data.begin() + mid, data.end());
    double upper = data[mid];
    if (data.size() % 2 == 1) return upper;
    double lower = *std::max_element(data.begin(), data.begin() + mid);
    return (lower + upper) / 2.0;
}

Ar1Fit fit_ar1(const std::vector<double>& series) noexcept {
    Ar1Fit fit;
    if (series.size() < 3) return fit;

    std::vector<double> x(series.begin(), series.end() - 1);
    std::vector<double> y(series.begin() + 1, series.end());
    fit.samples = x.size();

    double var_x = variance(x);
    double mean_x = mean(x);
    double mean_y = mean(y);

    if (var_x <= 0.0) {
        // Flat regressor: no information about reversion speed
        fit.slope = 0.0;
        fit.intercept = mean_y;
    } else {
        fit.slope = covariance(x, y) / var_x;
        fit.intercept = mean_y - fit.slope * mean_x;
    }

    double sse = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double r = y[i] - (fit.intercept + fit.slope * x[i]);
        sse += r * r;
    }
    fit.residual_variance = x.size() > 2 ? sse / static_cast<double>(x.size() - 2) : 0.0;

    return fit;
}

}  // namespace sniper::math
