#pragma once

#include "libnumfit/core/fit_options.hpp"
#include <Eigen/Dense>
#include <string>

namespace libnumfit {
namespace solvers {

/**
 * Output of a least-squares solve
 *
 * Besides the coefficients, every strategy returns (X'X)^{-1}, which the
 * inference layer needs for standard errors. Each strategy derives it from
 * its own factorization, so the statistics code never branches on the method.
 */
struct LeastSquaresSolution {
	/// Coefficient vector β (length = number of columns of X)
	Eigen::VectorXd coefficients;

	/// (X'X)^{-1} (p × p)
	Eigen::MatrixXd xtx_inverse;
};

/**
 * ILeastSquaresSolver: Abstract interface for least-squares solution strategies
 *
 * Every strategy solves the same normal equations (X'X) β = X'y by a
 * different numerical route. New routes can be added without touching the
 * statistics layer that consumes LeastSquaresSolution.
 *
 * The concrete solver classes (NormalEquationSolver, QRSolver) use static
 * methods; SolverAdapter wraps them for runtime selection by SolveMethod.
 */
class ILeastSquaresSolver {
public:
	virtual ~ILeastSquaresSolver() = default;

	/**
	 * Get the name of this strategy (e.g., "inverse", "qr")
	 */
	virtual std::string GetName() const = 0;

	/**
	 * Get the method identifier of this strategy
	 */
	virtual core::SolveMethod GetMethod() const = 0;

	/**
	 * Solve the least-squares problem min ||y - Xβ||²
	 *
	 * @param X Design matrix (n × p), full column rank required
	 * @param y Response vector (length n)
	 * @return Coefficients and (X'X)^{-1}
	 *
	 * @throws core::DimensionMismatchError if X.rows() != y.size()
	 * @throws core::SingularMatrixError if X'X is not invertible
	 */
	virtual LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) const = 0;
};

/**
 * SolverAdapter: Template adapter for static solver classes
 *
 * Template parameter TSolver must provide:
 * - static LeastSquaresSolution Solve(X, y, tolerance)
 * - static core::SolveMethod Method()
 */
template <typename TSolver>
class SolverAdapter : public ILeastSquaresSolver {
private:
	double tolerance_;

public:
	/**
	 * @param tolerance Relative tolerance used to declare the system singular
	 */
	explicit SolverAdapter(double tolerance) : tolerance_(tolerance) {
	}

	std::string GetName() const override {
		return core::SolveMethodName(TSolver::Method());
	}

	core::SolveMethod GetMethod() const override {
		return TSolver::Method();
	}

	LeastSquaresSolution Solve(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) const override {
		return TSolver::Solve(X, y, tolerance_);
	}
};

} // namespace solvers
} // namespace libnumfit
