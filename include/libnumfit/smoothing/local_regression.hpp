#pragma once

#include "libnumfit/core/errors.hpp"
#include "libnumfit/core/fit_options.hpp"
#include "libnumfit/core/loess_result.hpp"
#include "libnumfit/solvers/normal_equation_solver.hpp"
#include "libnumfit/utils/neighbor_selection.hpp"
#include "libnumfit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libnumfit {
namespace smoothing {

/**
 * LOESS: locally weighted polynomial regression
 *
 * For every point of estimation x0, an independent local fit:
 * 1. window_size = floor(span * n) nearest sample points by |x[j] - x0|
 *    (stable order: equal distances keep their index order)
 * 2. bandwidth h = floor(window_size / 2); u = (x[j] - x0) / h
 * 3. tricube weight (1 - |u|^3)^3 for |u| <= 1, else 0
 * 4. design matrix [1, d] (degree 1) or [1, d, d^2] (degree 2) over the
 *    window, with d = x[j] - x0
 * 5. solve (X'WX) β = X'Wy
 * 6. the local polynomial at x0 is β0
 *
 * The window is chosen by count while the kernel scales by h in units of x,
 * so a selected neighbor can end up with zero weight when the window is not
 * symmetric around x0. That behavior is kept as is.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Each point is a pure function of (x, y, x0), so the per-point map can be
 *   parallelized without changing results
 * - A singular local system aborts the whole fit
 */
class LocalRegression {
public:
	/// Relative tolerance for the local weighted normal equations, on the scale of the design
	static constexpr double kLocalSolveTolerance = 1e-12;

	/**
	 * Smooth y over the sample points
	 *
	 * @param x Abscissae (length n)
	 * @param y Responses (length n)
	 * @param options span in (0, 1) and degree in {1, 2}
	 * @return LoessResult with fitted values, residuals, SSE and MSE = SSE / n
	 *
	 * @throws core::InvalidParameterError for bad span / degree or non-finite input
	 * @throws core::DimensionMismatchError if x and y differ in length
	 * @throws core::InsufficientNeighborsError if floor(span * n) < degree + 1
	 * @throws core::SingularMatrixError if a local X'WX is singular
	 */
	static core::LoessResult Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
	                             const core::LoessOptions &options = core::LoessOptions());

	/**
	 * Evaluate the smoother at arbitrary query abscissae
	 *
	 * Neighborhoods are drawn from the sample exactly as in Fit(), with the
	 * query point in place of x[i].
	 */
	static core::LoessCurve Evaluate(const Eigen::VectorXd &x, const Eigen::VectorXd &y, const Eigen::VectorXd &query_x,
	                                 const core::LoessOptions &options = core::LoessOptions());

	/**
	 * Evenly spaced grid [lo, hi] with n_points points
	 *
	 * @throws core::InvalidParameterError if n_points < 2 or !(lo < hi)
	 */
	static Eigen::VectorXd MakeGrid(double lo, double hi, size_t n_points);

	/**
	 * Local polynomial estimate at a single abscissa
	 *
	 * @param x Sample abscissae
	 * @param y Sample responses
	 * @param x0 Point of estimation
	 * @param window_size Number of neighbors
	 * @param bandwidth Kernel scale h (> 0)
	 * @param degree 1 or 2
	 */
	static double EstimateAt(const Eigen::VectorXd &x, const Eigen::VectorXd &y, double x0, size_t window_size,
	                         double bandwidth, int degree);

	/// Tricube kernel: (1 - |u|^3)^3 for |u| <= 1, else 0
	static double TricubeWeight(double u) {
		const double a = std::abs(u);
		if (a > 1.0) {
			return 0.0;
		}
		const double c = 1.0 - a * a * a;
		return c * c * c;
	}

	/// floor(span * n)
	static size_t WindowSize(double span, size_t n) {
		return static_cast<size_t>(std::floor(span * static_cast<double>(n)));
	}

private:
	static void ValidateSample(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

	/// Window size for this sample; throws if too small for the degree
	static size_t CheckedWindowSize(const core::LoessOptions &options, size_t n);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void LocalRegression::ValidateSample(const Eigen::VectorXd &x, const Eigen::VectorXd &y) {
	if (x.size() != y.size()) {
		throw core::DimensionMismatchError::Lengths("LOESS response length must match abscissae",
		                                            static_cast<size_t>(x.size()), static_cast<size_t>(y.size()));
	}
	if (!x.allFinite() || !y.allFinite()) {
		throw core::InvalidParameterError("LOESS inputs must be finite");
	}
}

inline size_t LocalRegression::CheckedWindowSize(const core::LoessOptions &options, size_t n) {
	const size_t window_size = WindowSize(options.span, n);
	const size_t required = static_cast<size_t>(options.degree) + 1;
	if (window_size < required) {
		throw core::InsufficientNeighborsError("LOESS window of " + std::to_string(window_size) +
		                                       " points (span " + std::to_string(options.span) + " of " +
		                                       std::to_string(n) + ") is smaller than the " +
		                                       std::to_string(required) + " needed for degree " +
		                                       std::to_string(options.degree));
	}
	return window_size;
}

inline double LocalRegression::EstimateAt(const Eigen::VectorXd &x, const Eigen::VectorXd &y, double x0,
                                          size_t window_size, double bandwidth, int degree) {
	// Step 1: nearest window_size points, stable on ties
	const Eigen::VectorXd distances = (x.array() - x0).abs().matrix();
	const std::vector<size_t> neighbors = utils::NearestIndices(distances, window_size);

	const auto m = static_cast<Eigen::Index>(neighbors.size());
	const auto p = static_cast<Eigen::Index>(degree + 1);

	Eigen::MatrixXd X_local(m, p);
	Eigen::VectorXd y_local(m);
	Eigen::VectorXd weights(m);

	// Steps 2-4: tricube weights and local design matrix
	for (Eigen::Index r = 0; r < m; r++) {
		const auto j = static_cast<Eigen::Index>(neighbors[static_cast<size_t>(r)]);
		const double offset = x(j) - x0;
		weights(r) = TricubeWeight(offset / bandwidth);
		y_local(r) = y(j);

		// Powers of (x[j] - x0)
		double power = 1.0;
		for (Eigen::Index d = 0; d < p; d++) {
			X_local(r, d) = power;
			power *= offset;
		}
	}

	// Step 5: weighted normal equations
	const Eigen::VectorXd beta = solvers::NormalEquationSolver::SolveWeighted(X_local, weights, y_local,
	                                                                          kLocalSolveTolerance);

	// Step 6: at x0 every centered power vanishes except the constant
	return beta(0);
}

inline core::LoessResult LocalRegression::Fit(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                              const core::LoessOptions &options) {
	options.Validate();
	ValidateSample(x, y);

	const size_t n = static_cast<size_t>(x.size());
	const size_t window_size = CheckedWindowSize(options, n);
	const size_t bandwidth = window_size / 2;

	NUMFIT_DEBUG("LOESS fit: n=" << n << " span=" << options.span << " degree=" << options.degree
	                             << " window=" << window_size << " h=" << bandwidth);
	NUMFIT_TIMING_START();

	core::LoessResult result;
	result.n_obs = n;
	result.span = options.span;
	result.degree = options.degree;
	result.window_size = window_size;
	result.bandwidth = bandwidth;

	result.fitted_values.resize(x.size());
	for (Eigen::Index i = 0; i < x.size(); i++) {
		result.fitted_values(i) =
		    EstimateAt(x, y, x(i), window_size, static_cast<double>(bandwidth), options.degree);
		NUMFIT_TRACE("x0=" << x(i) << " fitted=" << result.fitted_values(i));
	}

	result.residuals = y - result.fitted_values;
	result.sse = result.residuals.squaredNorm();
	result.mse = result.sse / static_cast<double>(n);

	NUMFIT_TIMING_END("LOESS fit");
	return result;
}

inline core::LoessCurve LocalRegression::Evaluate(const Eigen::VectorXd &x, const Eigen::VectorXd &y,
                                                  const Eigen::VectorXd &query_x, const core::LoessOptions &options) {
	options.Validate();
	ValidateSample(x, y);
	if (!query_x.allFinite()) {
		throw core::InvalidParameterError("LOESS query points must be finite");
	}

	const size_t n = static_cast<size_t>(x.size());
	const size_t window_size = CheckedWindowSize(options, n);
	const size_t bandwidth = window_size / 2;

	NUMFIT_DEBUG("LOESS evaluate: n=" << n << " queries=" << query_x.size() << " window=" << window_size);

	core::LoessCurve curve;
	curve.query_x = query_x;
	curve.span = options.span;
	curve.degree = options.degree;
	curve.window_size = window_size;
	curve.bandwidth = bandwidth;

	curve.fitted_values.resize(query_x.size());
	for (Eigen::Index q = 0; q < query_x.size(); q++) {
		curve.fitted_values(q) =
		    EstimateAt(x, y, query_x(q), window_size, static_cast<double>(bandwidth), options.degree);
	}

	return curve;
}

inline Eigen::VectorXd LocalRegression::MakeGrid(double lo, double hi, size_t n_points) {
	if (n_points < 2) {
		throw core::InvalidParameterError("Grid needs at least 2 points (got " + std::to_string(n_points) + ")");
	}
	if (!(lo < hi) || !std::isfinite(lo) || !std::isfinite(hi)) {
		throw core::InvalidParameterError("Grid bounds must be finite with lo < hi");
	}
	return Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(n_points), lo, hi);
}

} // namespace smoothing
} // namespace libnumfit
