#pragma once
// Small statistics kernel: simple linear regression with a t-test on the
// slope, and Benjamini-Hochberg q-values.

#include <cstddef>
#include <vector>

namespace cubkit {

struct RegressionResult {
    double slope = 0.0;
    double intercept = 0.0;
    double std_error = 0.0;   // standard error of the slope
    double t_stat = 0.0;
    double p_value = 1.0;     // two-sided, df = n - 2
    size_t n = 0;
};

/**
 * Ordinary least squares fit y = intercept + slope * x.
 *
 * Throws InsufficientData for fewer than 3 points or when x has no
 * variance. A perfect fit has p_value 0 (slope != 0) or 1 (slope == 0).
 */
RegressionResult linear_regression(const std::vector<double>& x,
                                   const std::vector<double>& y);

/**
 * Benjamini-Hochberg adjusted p-values, same order as the input.
 * NA p-values stay NA and do not count towards the number of tests.
 */
std::vector<double> benjamini_hochberg(const std::vector<double>& p_values);

} // namespace cubkit
