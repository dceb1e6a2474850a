#pragma once

#include "libnumfit/core/errors.hpp"
#include "libnumfit/solvers/i_least_squares_solver.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <string>

namespace libnumfit {
namespace solvers {

/**
 * Normal-equation ("inverse") least-squares solver
 *
 * Algorithm:
 * 1. Form the normal matrix X'X (or X'WX for the weighted variant)
 * 2. Invert it with a fully pivoted LU decomposition
 * 3. β = (X'X)^{-1} X'y
 *
 * Singularity is detected from the LU pivots. X'X squares the scale of X, so
 * the relative tolerance (stated on the scale of X, like the diagonal of R in
 * QRSolver) is squared before it is compared with the pivots, and floored at
 * machine epsilon. A pivot below that threshold × |largest pivot| throws
 * core::SingularMatrixError instead of returning NaN/Inf.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - The weighted variant serves the local fits of the LOESS smoother
 */
class NormalEquationSolver {
public:
	static core::SolveMethod Method() {
		return core::SolveMethod::INVERSE;
	}

	/**
	 * Solve min ||y - Xβ||² via β = (X'X)^{-1} X'y
	 *
	 * @param X Design matrix (n × p)
	 * @param y Response vector (length n)
	 * @param tolerance Relative tolerance on the scale of X
	 * @return Coefficients and (X'X)^{-1}
	 */
	static LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double tolerance);

	/**
	 * Solve the weighted normal equations (X'WX) β = X'Wy, W = diag(weights)
	 *
	 * Zero weights are allowed; the corresponding rows simply drop out.
	 *
	 * @param X Design matrix (n × p)
	 * @param weights Nonnegative weights (length n)
	 * @param y Response vector (length n)
	 * @param tolerance Relative tolerance on the scale of X
	 * @return Coefficient vector β
	 */
	static Eigen::VectorXd SolveWeighted(const Eigen::MatrixXd &X, const Eigen::VectorXd &weights,
	                                     const Eigen::VectorXd &y, double tolerance);

	/**
	 * Invert a symmetric normal matrix, throwing if it is singular
	 *
	 * @param normal_matrix X'X or X'WX (p × p)
	 * @param tolerance Relative tolerance on the scale of X (squared internally)
	 * @param context Short description used in the error message
	 */
	static Eigen::MatrixXd InvertNormalMatrix(const Eigen::MatrixXd &normal_matrix, double tolerance,
	                                          const std::string &context);

	/// Relative pivot threshold for X'X given a tolerance on the scale of X
	static double PivotThreshold(double tolerance);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double NormalEquationSolver::PivotThreshold(double tolerance) {
	const double scaled = tolerance > 0.0 ? tolerance * tolerance : 0.0;
	return std::max(scaled, Eigen::NumTraits<double>::epsilon());
}

inline Eigen::MatrixXd NormalEquationSolver::InvertNormalMatrix(const Eigen::MatrixXd &normal_matrix,
                                                               double tolerance, const std::string &context) {
	if (!normal_matrix.allFinite()) {
		throw core::SingularMatrixError(context + ": normal matrix contains non-finite entries");
	}

	Eigen::FullPivLU<Eigen::MatrixXd> lu(normal_matrix);
	lu.setThreshold(PivotThreshold(tolerance));

	if (!lu.isInvertible()) {
		throw core::SingularMatrixError(context + ": normal matrix is singular (rank " + std::to_string(lu.rank()) +
		                                " < " + std::to_string(normal_matrix.cols()) + ")");
	}

	return lu.inverse();
}

inline LeastSquaresSolution NormalEquationSolver::Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                        double tolerance) {
	if (X.rows() != y.size()) {
		throw core::DimensionMismatchError::Lengths("Response length must match design matrix rows",
		                                            static_cast<size_t>(X.rows()), static_cast<size_t>(y.size()));
	}

	LeastSquaresSolution solution;

	Eigen::MatrixXd XtX = X.transpose() * X;
	solution.xtx_inverse = InvertNormalMatrix(XtX, tolerance, "inverse solver");
	solution.coefficients = solution.xtx_inverse * (X.transpose() * y);

	return solution;
}

inline Eigen::VectorXd NormalEquationSolver::SolveWeighted(const Eigen::MatrixXd &X, const Eigen::VectorXd &weights,
                                                           const Eigen::VectorXd &y, double tolerance) {
	if (X.rows() != y.size()) {
		throw core::DimensionMismatchError::Lengths("Response length must match design matrix rows",
		                                            static_cast<size_t>(X.rows()), static_cast<size_t>(y.size()));
	}
	if (X.rows() != weights.size()) {
		throw core::DimensionMismatchError::Lengths("Weights length must match design matrix rows",
		                                            static_cast<size_t>(X.rows()),
		                                            static_cast<size_t>(weights.size()));
	}

	// X'W computed once and reused for both sides
	Eigen::MatrixXd XtW = X.transpose() * weights.asDiagonal();
	Eigen::MatrixXd XtWX = XtW * X;
	Eigen::MatrixXd XtWX_inv = InvertNormalMatrix(XtWX, tolerance, "weighted normal equations");

	return XtWX_inv * (XtW * y);
}

} // namespace solvers
} // namespace libnumfit
