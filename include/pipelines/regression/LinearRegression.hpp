#pragma once

// Standard
#include <cstddef>
#include <vector>

namespace pipelines::regression {

struct RegressionFit {
    double slope;
    double intercept;
    double pValue;
    size_t sampleCount;
};

/**
 * @brief Ordinary least squares fit of y = intercept + slope * x.
 *
 * The p-value is the two-sided Student t test of the slope against zero with n - 2 degrees
 * of freedom. A perfect fit has a p-value of 0.
 */
class LinearRegression {
   public:
    LinearRegression() = delete;

    /**
     * @throws errors::RegressionFailure if the inputs differ in length, hold fewer than three
     * points, contain non-finite values or x is constant.
     */
    [[nodiscard]] static auto fit(const std::vector<double> &x, const std::vector<double> &y)
        -> RegressionFit;
};

}  // namespace pipelines::regression
