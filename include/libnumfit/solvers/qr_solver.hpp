#pragma once

#include "libnumfit/core/errors.hpp"
#include "libnumfit/solvers/i_least_squares_solver.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace libnumfit {
namespace solvers {

/**
 * Orthogonal-triangular ("qr") least-squares solver
 *
 * Uses Eigen's HouseholderQR decomposition without column pivoting so the
 * coefficient order matches the columns of X.
 *
 * Algorithm:
 * 1. QR decomposition: X = Q*R
 * 2. Check the diagonal of R: |R_ii| <= tolerance * max|R_jj| means X is
 *    rank deficient and X'X = R'R is singular
 * 3. Solve R*β = Q'y by back-substitution, bottom row first
 * 4. (X'X)^{-1} = R^{-1} R^{-T}
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Never forms X'X, so it tolerates worse conditioning than the inverse route
 */
class QRSolver {
public:
	static core::SolveMethod Method() {
		return core::SolveMethod::QR;
	}

	/**
	 * Solve min ||y - Xβ||² via X = QR and R*β = Q'y
	 *
	 * @param X Design matrix (n × p), n >= p
	 * @param y Response vector (length n)
	 * @param tolerance Relative tolerance on the diagonal of R
	 * @return Coefficients and (X'X)^{-1}
	 */
	static LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double tolerance);

	/**
	 * Solve an upper-triangular system R*β = b by back-substitution
	 *
	 * Starts at the bottom row and works upward.
	 *
	 * @param R Upper-triangular matrix (p × p), nonzero diagonal
	 * @param b Right-hand side (length p)
	 */
	static Eigen::VectorXd BackSubstitute(const Eigen::MatrixXd &R, const Eigen::VectorXd &b);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::VectorXd QRSolver::BackSubstitute(const Eigen::MatrixXd &R, const Eigen::VectorXd &b) {
	const Eigen::Index p = R.cols();
	Eigen::VectorXd beta(p);

	for (Eigen::Index i = p - 1; i >= 0; i--) {
		double sum = b(i);
		for (Eigen::Index j = i + 1; j < p; j++) {
			sum -= R(i, j) * beta(j);
		}
		beta(i) = sum / R(i, i);
	}

	return beta;
}

inline LeastSquaresSolution QRSolver::Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double tolerance) {
	if (X.rows() != y.size()) {
		throw core::DimensionMismatchError::Lengths("Response length must match design matrix rows",
		                                            static_cast<size_t>(X.rows()), static_cast<size_t>(y.size()));
	}

	const Eigen::Index p = X.cols();
	if (X.rows() < p) {
		throw core::SingularMatrixError("qr solver: fewer rows (" + std::to_string(X.rows()) + ") than columns (" +
		                                std::to_string(p) + ")");
	}
	if (!X.allFinite()) {
		throw core::SingularMatrixError("qr solver: design matrix contains non-finite entries");
	}

	// Step 1: QR decomposition
	Eigen::HouseholderQR<Eigen::MatrixXd> qr(X);
	Eigen::MatrixXd R = qr.matrixQR().topRows(p).triangularView<Eigen::Upper>();

	// Step 2: Rank check on the diagonal of R
	const double max_diag = R.diagonal().cwiseAbs().maxCoeff();
	const double threshold = (tolerance > 0.0 ? tolerance : 1e-10) * max_diag;
	for (Eigen::Index i = 0; i < p; i++) {
		if (!(max_diag > 0.0) || std::abs(R(i, i)) <= threshold) {
			throw core::SingularMatrixError("qr solver: design matrix is rank deficient (R[" + std::to_string(i) +
			                                "," + std::to_string(i) + "] is zero)");
		}
	}

	// Step 3: Q'y, then back-substitution on R
	Eigen::VectorXd Qty = qr.householderQ().transpose() * y;

	LeastSquaresSolution solution;
	solution.coefficients = BackSubstitute(R, Qty.head(p));

	// Step 4: (X'X)^{-1} = (R'R)^{-1} = R^{-1} R^{-T}
	Eigen::MatrixXd R_inv = R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(p, p));
	solution.xtx_inverse = R_inv * R_inv.transpose();

	return solution;
}

} // namespace solvers
} // namespace libnumfit
