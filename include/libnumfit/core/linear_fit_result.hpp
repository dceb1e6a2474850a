#pragma once

#include "libnumfit/core/fit_options.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace libnumfit {
namespace core {

/**
 * Coefficient table of a linear fit
 *
 * Row 0 is the intercept, row 1 the slope. NaN marks values that could not
 * be computed (e.g. a t-statistic with zero standard error).
 */
struct CoefficientTable {
	/// Row names ("(Intercept)", "x")
	std::vector<std::string> names;

	/// Estimated coefficients β
	Eigen::VectorXd estimates;

	/// sqrt(σ̂² · diag((X'X)^{-1}))
	Eigen::VectorXd std_errors;

	/// estimate / std_error
	Eigen::VectorXd t_statistics;

	/// Two-tailed p-values from t(df_residual)
	Eigen::VectorXd p_values;

	/// β - t_crit · sqrt(MS_error · diag((X'X)^{-1}))
	Eigen::VectorXd ci_lower;

	/// β + t_crit · sqrt(MS_error · diag((X'X)^{-1}))
	Eigen::VectorXd ci_upper;

	/// Degrees of freedom of the t-distribution used
	size_t degrees_of_freedom = 0;

	/// Confidence level of ci_lower / ci_upper
	double confidence_level = 0.95;

	CoefficientTable() = default;

	/// Convenience constructor with dimensions
	CoefficientTable(size_t n_params, double conf_level) : confidence_level(conf_level) {
		const auto p = static_cast<Eigen::Index>(n_params);
		const double nan = std::numeric_limits<double>::quiet_NaN();
		names.resize(n_params);
		estimates = Eigen::VectorXd::Constant(p, nan);
		std_errors = Eigen::VectorXd::Constant(p, nan);
		t_statistics = Eigen::VectorXd::Constant(p, nan);
		p_values = Eigen::VectorXd::Constant(p, nan);
		ci_lower = Eigen::VectorXd::Constant(p, nan);
		ci_upper = Eigen::VectorXd::Constant(p, nan);
	}

	size_t size() const {
		return static_cast<size_t>(estimates.size());
	}
};

/**
 * ANOVA decomposition of a linear fit
 *
 * SS_regression + SS_residual = SS_total (up to rounding).
 */
struct AnovaTable {
	double ss_regression = std::numeric_limits<double>::quiet_NaN();
	double ss_residual = std::numeric_limits<double>::quiet_NaN();
	double ss_total = std::numeric_limits<double>::quiet_NaN();

	/// Number of predictors
	size_t df_regression = 0;

	/// n - predictors - 1
	size_t df_residual = 0;

	/// n - 1
	size_t df_total = 0;

	double ms_regression = std::numeric_limits<double>::quiet_NaN();
	double ms_error = std::numeric_limits<double>::quiet_NaN();

	/// MS_regression / MS_error
	double f_statistic = std::numeric_limits<double>::quiet_NaN();

	/// P(F > f_statistic) with (df_regression, df_residual) degrees of freedom
	double f_p_value = std::numeric_limits<double>::quiet_NaN();

	AnovaTable() = default;
};

/**
 * Confidence and prediction bands around fitted (or predicted) values
 *
 * Only the bands flagged by has_confidence / has_prediction are populated.
 */
struct IntervalTable {
	/// Abscissae the bands were evaluated at
	Eigen::VectorXd x;

	/// Point estimates β0 + β1·x
	Eigen::VectorXd fitted;

	/// Bounds for the mean response
	Eigen::VectorXd confidence_lower;
	Eigen::VectorXd confidence_upper;

	/// Bounds for an individual new observation (wider)
	Eigen::VectorXd prediction_lower;
	Eigen::VectorXd prediction_upper;

	double confidence_level = 0.95;

	size_t degrees_of_freedom = 0;

	bool has_confidence = false;

	bool has_prediction = false;

	IntervalTable() = default;
};

/**
 * Result of a single-predictor OLS fit
 *
 * Created once per LinearRegressionEngine::Fit call, never mutated afterwards.
 */
struct LinearFitResult {
	// ========================================================================
	// Core outputs
	// ========================================================================

	/// β0 + β1·x at each observation (length = n_obs)
	Eigen::VectorXd fitted_values;

	/// y - fitted_values (length = n_obs)
	Eigen::VectorXd residuals;

	/// Sum of squared residuals
	double sse = std::numeric_limits<double>::quiet_NaN();

	/// σ̂² = SSE / df_residual
	double sigma_squared = std::numeric_limits<double>::quiet_NaN();

	/// σ̂ = sqrt(σ̂²), the residual standard error
	double sigma = std::numeric_limits<double>::quiet_NaN();

	/// SS_regression / SS_total
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// 1 - (1 - R²)(n - 1)/(n - p)
	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();

	/// (X'X)^{-1} from the solve (p × p)
	Eigen::MatrixXd xtx_inverse;

	// ========================================================================
	// Dimensions
	// ========================================================================

	size_t n_obs = 0;

	/// Columns of the design matrix [1, x]
	size_t n_params = 0;

	/// n_obs - n_params
	size_t df_residual = 0;

	// ========================================================================
	// Settings and tables
	// ========================================================================

	SolveMethod method = SolveMethod::INVERSE;

	IntervalKind interval = IntervalKind::NONE;

	double level = 0.95;

	CoefficientTable coefficients;

	AnovaTable anova;

	IntervalTable intervals;

	LinearFitResult() = default;

	double intercept() const {
		return coefficients.estimates(0);
	}

	double slope() const {
		return coefficients.estimates(1);
	}
};

} // namespace core
} // namespace libnumfit
