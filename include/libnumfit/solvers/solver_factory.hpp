#pragma once

#include "libnumfit/solvers/i_least_squares_solver.hpp"
#include "libnumfit/solvers/normal_equation_solver.hpp"
#include "libnumfit/solvers/qr_solver.hpp"
#include <memory>

namespace libnumfit {
namespace solvers {

/**
 * Create the least-squares strategy for a solution method
 *
 * @param method Solution route (inverse or qr)
 * @param tolerance Relative singularity tolerance (<= 0 selects the default)
 * @return Owning pointer to the strategy
 */
inline std::unique_ptr<ILeastSquaresSolver> CreateLeastSquaresSolver(core::SolveMethod method, double tolerance) {
	switch (method) {
	case core::SolveMethod::INVERSE:
		return std::make_unique<SolverAdapter<NormalEquationSolver>>(tolerance);
	case core::SolveMethod::QR:
		return std::make_unique<SolverAdapter<QRSolver>>(tolerance);
	}
	throw core::InvalidParameterError("Unsupported solve method");
}

} // namespace solvers
} // namespace libnumfit
