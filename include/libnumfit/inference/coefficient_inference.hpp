#pragma once

#include "../core/linear_fit_result.hpp"
#include "../utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace libnumfit {
namespace inference {

/**
 * CoefficientInference: Statistical inference for regression coefficients
 *
 * This class provides methods to compute:
 * - Standard errors of coefficients
 * - t-statistics for hypothesis testing
 * - p-values (two-tailed tests)
 * - Confidence intervals
 *
 * The inference is based on the standard OLS theory:
 * - SE(β_j) = sqrt(σ² * (X'X)^{-1}_{jj})
 * - t_j = β_j / SE(β_j)  ~ t(df)
 * - p_j = 2 * P(|T| > |t_j|)
 * - CI_j = β_j ± t_{α/2} * sqrt(MS_error * (X'X)^{-1}_{jj})
 *
 * (X'X)^{-1} comes from the least-squares strategy that produced β, so the
 * same code serves every solution method.
 */
class CoefficientInference {
public:
	/// Lower bound applied to σ² before taking standard errors
	static constexpr double kMinVariance = 1e-20;

	/**
	 * Build the full coefficient table
	 *
	 * @param coefficients Estimated β (length p)
	 * @param xtx_inverse (X'X)^{-1} (p × p)
	 * @param sigma_squared Residual variance estimate used for SE and t
	 * @param df_t Degrees of freedom for t-statistics and p-values
	 * @param ms_error Residual mean square used for the coefficient CIs
	 * @param df_ci Degrees of freedom for the CI critical value
	 * @param confidence_level Confidence level in (0, 1)
	 * @param names Row names (length p)
	 */
	static core::CoefficientTable BuildTable(const Eigen::VectorXd &coefficients, const Eigen::MatrixXd &xtx_inverse,
	                                         double sigma_squared, size_t df_t, double ms_error, size_t df_ci,
	                                         double confidence_level, const std::vector<std::string> &names);

	/**
	 * Compute coefficient standard errors
	 *
	 * SE(β_j) = sqrt(σ² * (X'X)^{-1}_{jj})
	 */
	static Eigen::VectorXd ComputeStdErrors(double sigma_squared, const Eigen::MatrixXd &xtx_inverse);

	/**
	 * Compute t-statistics for coefficients
	 *
	 * t_j = β_j / SE(β_j); NaN where SE is zero or NaN
	 */
	static Eigen::VectorXd ComputeTStatistics(const Eigen::VectorXd &coefficients, const Eigen::VectorXd &std_errors);

	/**
	 * Compute two-tailed p-values from t-statistics
	 *
	 * p_j = 2 * P(|T| > |t_j|) where T ~ t(df)
	 */
	static Eigen::VectorXd ComputePValues(const Eigen::VectorXd &t_statistics, size_t df);

	/**
	 * Compute confidence intervals for coefficients
	 *
	 * CI_j = β_j ± t_{α/2, df} * sqrt(ms_error * (X'X)^{-1}_{jj})
	 *
	 * @return Pair of (lower_bounds, upper_bounds)
	 */
	static std::pair<Eigen::VectorXd, Eigen::VectorXd>
	ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients, const Eigen::MatrixXd &xtx_inverse,
	                           double ms_error, size_t df, double confidence_level);
};

} // namespace inference
} // namespace libnumfit

#include "coefficient_inference_impl.hpp"
