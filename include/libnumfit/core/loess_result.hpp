#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <limits>

namespace libnumfit {
namespace core {

/**
 * Result of a LOESS fit over the sample points
 *
 * Built once per LocalRegression::Fit call and handed to the caller by value.
 */
struct LoessResult {
	/// Smoothed value at each x[i] (length = n_obs)
	Eigen::VectorXd fitted_values;

	/// y - fitted_values (length = n_obs)
	Eigen::VectorXd residuals;

	/// Sum of squared residuals
	double sse = std::numeric_limits<double>::quiet_NaN();

	/// SSE / n_obs
	double mse = std::numeric_limits<double>::quiet_NaN();

	/// Number of observations
	size_t n_obs = 0;

	// ========================================================================
	// Settings the fit was computed with
	// ========================================================================

	double span = std::numeric_limits<double>::quiet_NaN();

	int degree = 0;

	/// floor(span * n_obs)
	size_t window_size = 0;

	/// floor(window_size / 2), in units of x
	size_t bandwidth = 0;

	LoessResult() = default;

	/// Root of the mean squared error
	double rmse() const {
		return std::sqrt(mse);
	}
};

/**
 * LOESS curve evaluated at arbitrary query abscissae
 *
 * Used to draw a smooth curve on a grid rather than at the sample points.
 */
struct LoessCurve {
	/// Query abscissae (length = n_query)
	Eigen::VectorXd query_x;

	/// Local polynomial value at each query point (length = n_query)
	Eigen::VectorXd fitted_values;

	double span = std::numeric_limits<double>::quiet_NaN();

	int degree = 0;

	size_t window_size = 0;

	size_t bandwidth = 0;

	LoessCurve() = default;
};

} // namespace core
} // namespace libnumfit
