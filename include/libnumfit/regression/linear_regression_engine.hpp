#pragma once

#include "libnumfit/core/errors.hpp"
#include "libnumfit/core/fit_options.hpp"
#include "libnumfit/core/linear_fit_result.hpp"
#include "libnumfit/inference/anova.hpp"
#include "libnumfit/inference/coefficient_inference.hpp"
#include "libnumfit/inference/fitted_intervals.hpp"
#include "libnumfit/solvers/solver_factory.hpp"
#include "libnumfit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <string>

namespace libnumfit {
namespace regression {

/**
 * Single-predictor Ordinary Least Squares engine with inference
 *
 * Fits y = β0 + β1·x with design matrix [1, x] and derives:
 * - coefficient table (SE, t, two-sided p, CI)
 * - ANOVA table with F-test
 * - R² and adjusted R²
 * - optional confidence / prediction bands at every observation
 *
 * Algorithm:
 * 1. Build X = [1, x]
 * 2. Solve the normal equations with the strategy selected by options.method
 *    ("inverse": (X'X)^{-1}X'y, "qr": X = QR then R·β = Q'y)
 * 3. Residuals, SSE, σ̂² = SSE / (n - p)
 * 4. Inference from β and the (X'X)^{-1} returned by the strategy
 *
 * Both strategies solve the same normal equations, so their coefficients
 * agree to floating-point tolerance.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - The statistics layer never branches on the solve method
 */
class LinearRegressionEngine {
public:
	/// Columns of the design matrix [1, x]
	static constexpr size_t kNumParams = 2;

	/**
	 * Fit the model
	 *
	 * @param y Response vector (length n, n >= 3)
	 * @param x Predictor vector (length n)
	 * @param options Method, interval kind and confidence level
	 * @return LinearFitResult with all derived tables
	 *
	 * @throws core::DimensionMismatchError if lengths differ or n < 3
	 * @throws core::InvalidParameterError if level is outside (0, 1) or inputs are not finite
	 * @throws core::SingularMatrixError if X'X is singular (e.g. constant x)
	 */
	static core::LinearFitResult Fit(const Eigen::VectorXd &y, const Eigen::VectorXd &x,
	                                 const core::LinearRegressionOptions &options = core::LinearRegressionOptions());

	/**
	 * Fit the model with method / interval given by name
	 *
	 * @param method "inverse" or "qr"
	 * @param interval "none", "confidence", "prediction" or "both"
	 * @param level Confidence level in (0, 1)
	 *
	 * @throws core::InvalidParameterError for unknown names
	 */
	static core::LinearFitResult Fit(const Eigen::VectorXd &y, const Eigen::VectorXd &x, const std::string &method,
	                                 const std::string &interval, double level);

	/**
	 * Fit the model with a caller-supplied least-squares strategy
	 */
	static core::LinearFitResult Fit(const Eigen::VectorXd &y, const Eigen::VectorXd &x,
	                                 const solvers::ILeastSquaresSolver &solver, core::IntervalKind interval,
	                                 double level);

	/**
	 * Point predictions with confidence / prediction bands at new abscissae
	 *
	 * @param fit Result of Fit() on sample_x
	 * @param sample_x Predictor values the model was fitted on
	 * @param new_x Abscissae to predict at
	 * @param kind Bands to compute (defaults to both)
	 */
	static core::IntervalTable PredictIntervals(const core::LinearFitResult &fit, const Eigen::VectorXd &sample_x,
	                                            const Eigen::VectorXd &new_x,
	                                            core::IntervalKind kind = core::IntervalKind::BOTH);

	/**
	 * Build the design matrix [1, x]
	 */
	static Eigen::MatrixXd BuildDesignMatrix(const Eigen::VectorXd &x);

private:
	static void ValidateInputs(const Eigen::VectorXd &y, const Eigen::VectorXd &x);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd LinearRegressionEngine::BuildDesignMatrix(const Eigen::VectorXd &x) {
	Eigen::MatrixXd X(x.size(), static_cast<Eigen::Index>(kNumParams));
	X.col(0).setOnes();
	X.col(1) = x;
	return X;
}

inline void LinearRegressionEngine::ValidateInputs(const Eigen::VectorXd &y, const Eigen::VectorXd &x) {
	if (y.size() != x.size()) {
		throw core::DimensionMismatchError::Lengths("Predictor length must match response length",
		                                            static_cast<size_t>(y.size()), static_cast<size_t>(x.size()));
	}
	if (static_cast<size_t>(y.size()) <= kNumParams) {
		throw core::DimensionMismatchError("Linear regression needs at least " + std::to_string(kNumParams + 1) +
		                                   " observations (got " + std::to_string(y.size()) + ")");
	}
	if (!y.allFinite() || !x.allFinite()) {
		throw core::InvalidParameterError("Linear regression inputs must be finite");
	}
}

inline core::LinearFitResult LinearRegressionEngine::Fit(const Eigen::VectorXd &y, const Eigen::VectorXd &x,
                                                         const core::LinearRegressionOptions &options) {
	options.Validate();
	auto solver = solvers::CreateLeastSquaresSolver(options.method, options.EffectiveTolerance());
	return Fit(y, x, *solver, options.interval, options.level);
}

inline core::LinearFitResult LinearRegressionEngine::Fit(const Eigen::VectorXd &y, const Eigen::VectorXd &x,
                                                         const std::string &method, const std::string &interval,
                                                         double level) {
	return Fit(y, x, core::LinearRegressionOptions::FromNames(method, interval, level));
}

inline core::LinearFitResult LinearRegressionEngine::Fit(const Eigen::VectorXd &y, const Eigen::VectorXd &x,
                                                         const solvers::ILeastSquaresSolver &solver,
                                                         core::IntervalKind interval, double level) {
	if (!(level > 0.0 && level < 1.0)) {
		throw core::InvalidParameterError("level must be in (0, 1) (got " + std::to_string(level) + ")");
	}
	ValidateInputs(y, x);

	const size_t n = static_cast<size_t>(y.size());
	NUMFIT_DEBUG("OLS fit: n=" << n << " method=" << solver.GetName() << " interval="
	                           << core::IntervalKindName(interval) << " level=" << level);

	// Step 1: Design matrix
	const Eigen::MatrixXd X = BuildDesignMatrix(x);

	// Step 2: Solve the normal equations
	solvers::LeastSquaresSolution solution = solver.Solve(X, y);

	core::LinearFitResult result;
	result.n_obs = n;
	result.n_params = kNumParams;
	result.df_residual = n - kNumParams;
	result.method = solver.GetMethod();
	result.interval = interval;
	result.level = level;
	result.xtx_inverse = solution.xtx_inverse;

	// Step 3: Fitted values, residuals, residual variance
	result.fitted_values = X * solution.coefficients;
	result.residuals = y - result.fitted_values;
	result.sse = result.residuals.squaredNorm();
	result.sigma_squared = result.sse / static_cast<double>(result.df_residual);
	result.sigma = std::sqrt(result.sigma_squared);

	// Step 4: ANOVA decomposition and R²
	result.anova = inference::AnovaDecomposition::Compute(X, y, solution.coefficients);

	if (result.anova.ss_total > 0.0) {
		result.r_squared = result.anova.ss_regression / result.anova.ss_total;
	} else {
		// Constant response: nothing to explain
		result.r_squared = 0.0;
	}
	// Rounding can push R² marginally outside [0, 1]
	result.r_squared = std::min(1.0, std::max(0.0, result.r_squared));

	const double adj_factor = static_cast<double>(n - 1) / static_cast<double>(result.df_residual);
	result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * adj_factor;

	// Step 5: Coefficient table
	result.coefficients = inference::CoefficientInference::BuildTable(
	    solution.coefficients, solution.xtx_inverse, result.sigma_squared, result.df_residual, result.anova.ms_error,
	    result.anova.df_residual, level, {"(Intercept)", "x"});

	// Step 6: Bands around the fitted values
	result.intervals = inference::FittedIntervals::Compute(x, x, result.fitted_values, result.sigma,
	                                                       result.df_residual, level, interval);

	NUMFIT_DEBUG("OLS fit done: beta=(" << result.intercept() << ", " << result.slope() << ") R2=" << result.r_squared
	                                    << " F=" << result.anova.f_statistic);

	return result;
}

inline core::IntervalTable LinearRegressionEngine::PredictIntervals(const core::LinearFitResult &fit,
                                                                    const Eigen::VectorXd &sample_x,
                                                                    const Eigen::VectorXd &new_x,
                                                                    core::IntervalKind kind) {
	if (static_cast<size_t>(sample_x.size()) != fit.n_obs) {
		throw core::DimensionMismatchError::Lengths("Sample predictor must match the fitted observations", fit.n_obs,
		                                            static_cast<size_t>(sample_x.size()));
	}
	if (fit.coefficients.size() != kNumParams) {
		throw core::DimensionMismatchError::Lengths("Fitted coefficients", kNumParams, fit.coefficients.size());
	}
	if (!new_x.allFinite()) {
		throw core::InvalidParameterError("Prediction abscissae must be finite");
	}

	const Eigen::VectorXd predictions = BuildDesignMatrix(new_x) * fit.coefficients.estimates;
	return inference::FittedIntervals::Compute(sample_x, new_x, predictions, fit.sigma, fit.df_residual, fit.level,
	                                           kind);
}

} // namespace regression
} // namespace libnumfit
