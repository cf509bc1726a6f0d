#include "LinearRegression.hpp"

// Standard
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>

// Boost
#include <boost/math/distributions/students_t.hpp>
#include <boost/math/statistics/linear_regression.hpp>

// Internal
#include "Errors.hpp"

namespace math = boost::math;  // NOLINT
namespace statistics = boost::math::statistics;

namespace {
// 1 - R^2 at or below this is a perfect fit within double rounding.
constexpr double perfectFitTolerance = 8.0 * std::numeric_limits<double>::epsilon();
}  // namespace

namespace pipelines::regression {

auto LinearRegression::fit(const std::vector<double> &x, const std::vector<double> &y)
    -> RegressionFit {
    if (x.size() != y.size()) {
        throw errors::RegressionFailure("Predictor and response differ in length: " +
                                        std::to_string(x.size()) + " vs " +
                                        std::to_string(y.size()));
    }

    const size_t sampleCount = x.size();
    if (sampleCount < 3) {
        throw errors::RegressionFailure("At least three points are needed, got " +
                                        std::to_string(sampleCount));
    }

    for (size_t i = 0; i < sampleCount; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            throw errors::RegressionFailure("Non-finite value at point " + std::to_string(i));
        }
    }

    double intercept = 0.0;
    double slope = 0.0;
    double rSquared = 0.0;
    try {
        std::tie(intercept, slope, rSquared) =
            statistics::simple_ordinary_least_squares_with_R_squared(x, y);
    } catch (const std::domain_error &e) {
        throw errors::RegressionFailure(e.what());
    }

    if (!std::isfinite(intercept) || !std::isfinite(slope) || !std::isfinite(rSquared)) {
        throw errors::RegressionFailure("Fit did not converge to finite values");
    }

    // t^2 = R^2 (n - 2) / (1 - R^2) for the slope of a simple regression
    const double degreesOfFreedom = static_cast<double>(sampleCount) - 2.0;
    const double unexplained = std::clamp(1.0 - rSquared, 0.0, 1.0);

    double pValue = 0.0;
    if (unexplained > perfectFitTolerance) {
        const double tStatistic =
            std::sqrt((1.0 - unexplained) * degreesOfFreedom / unexplained);
        const math::students_t distribution(degreesOfFreedom);
        pValue = 2.0 * math::cdf(math::complement(distribution, tStatistic));
    }

    return RegressionFit{.slope = slope,
                         .intercept = intercept,
                         .pValue = pValue,
                         .sampleCount = sampleCount};
}

}  // namespace pipelines::regression
