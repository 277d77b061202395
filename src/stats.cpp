#include "cubkit/stats.hpp"
#include "cubkit/types.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include <boost/math/distributions/students_t.hpp>

namespace cubkit {

RegressionResult linear_regression(const std::vector<double>& x,
                                   const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("linear_regression: x and y differ in length");
    }
    const size_t n = x.size();
    if (n < 3) {
        throw InsufficientData("Regression needs at least 3 observations, got " +
                               std::to_string(n));
    }

    const double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / n;
    const double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxx = 0.0, sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mean_x;
        sxx += dx * dx;
        sxy += dx * (y[i] - mean_y);
    }
    if (!(sxx > 0.0)) {
        throw InsufficientData("Regression predictor has no variance");
    }

    RegressionResult r;
    r.n = n;
    r.slope = sxy / sxx;
    r.intercept = mean_y - r.slope * mean_x;

    double rss = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double e = y[i] - (r.intercept + r.slope * x[i]);
        rss += e * e;
    }
    const double df = static_cast<double>(n - 2);
    r.std_error = std::sqrt(rss / df / sxx);

    // Rounding noise on an exact fit
    if (r.std_error <= 1e-12 * std::max(1.0, std::abs(r.slope))) {
        r.std_error = 0.0;
        r.t_stat = r.slope == 0.0 ? 0.0 : std::copysign(std::numeric_limits<double>::infinity(), r.slope);
        r.p_value = r.slope == 0.0 ? 1.0 : 0.0;
        return r;
    }

    r.t_stat = r.slope / r.std_error;
    boost::math::students_t dist(df);
    r.p_value = 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(r.t_stat)));
    r.p_value = std::min(1.0, r.p_value);
    return r;
}

std::vector<double> benjamini_hochberg(const std::vector<double>& p_values) {
    std::vector<double> q(p_values.size(), NA);

    std::vector<size_t> order;
    order.reserve(p_values.size());
    for (size_t i = 0; i < p_values.size(); ++i) {
        if (!is_na(p_values[i])) order.push_back(i);
    }
    if (order.empty()) return q;

    std::sort(order.begin(), order.end(),
              [&](size_t a, size_t b) { return p_values[a] < p_values[b]; });

    const double m = static_cast<double>(order.size());
    double running_min = 1.0;
    for (size_t k = order.size(); k-- > 0;) {
        const double rank = static_cast<double>(k + 1);
        running_min = std::min(running_min, p_values[order[k]] * m / rank);
        q[order[k]] = running_min;
    }
    return q;
}

} // namespace cubkit
