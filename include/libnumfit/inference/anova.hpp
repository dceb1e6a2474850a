#pragma once

#include "../core/errors.hpp"
#include "../core/linear_fit_result.hpp"
#include "../utils/distributions.hpp"
#include "coefficient_inference.hpp"
#include <algorithm>
#include <Eigen/Dense>
#include <cmath>
#include <limits>

namespace libnumfit {
namespace inference {

/**
 * ANOVA decomposition for a linear model with intercept
 *
 *   SS_regression = β'X'Xβ - n·ȳ²
 *   SS_residual   = (y - Xβ)'(y - Xβ)
 *   SS_total      = y'y - n·ȳ²
 *   MS_regression = SS_regression / q
 *   MS_error      = SS_residual / (n - q - 1)
 *   F             = MS_regression / MS_error  ~  F(q, n - q - 1)
 *
 * where q is the number of predictors (design columns minus the intercept).
 */
class AnovaDecomposition {
public:
	/**
	 * @param X Design matrix with the intercept in column 0 (n × (q + 1))
	 * @param y Response vector (length n)
	 * @param coefficients Fitted β (length q + 1)
	 * @return ANOVA table
	 */
	static core::AnovaTable Compute(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                const Eigen::VectorXd &coefficients) {
		const size_t n = static_cast<size_t>(X.rows());
		if (X.cols() < 1 || coefficients.size() != X.cols()) {
			throw core::DimensionMismatchError::Lengths("ANOVA coefficients", static_cast<size_t>(X.cols()),
			                                            static_cast<size_t>(coefficients.size()));
		}
		const size_t q = static_cast<size_t>(X.cols()) - 1;
		if (n <= q + 1) {
			throw core::DimensionMismatchError("ANOVA needs more observations than parameters (n = " +
			                                   std::to_string(n) + ")");
		}

		const double n_d = static_cast<double>(n);
		const double y_mean = y.mean();
		const double n_ybar_sq = n_d * y_mean * y_mean;

		core::AnovaTable table;
		const Eigen::VectorXd Xb = X * coefficients;

		// β'X'Xβ = ||Xβ||²
		table.ss_regression = Xb.squaredNorm() - n_ybar_sq;
		table.ss_residual = (y - Xb).squaredNorm();
		table.ss_total = y.squaredNorm() - n_ybar_sq;

		table.df_regression = q;
		table.df_residual = n - q - 1;
		table.df_total = n - 1;

		table.ms_error = table.ss_residual / static_cast<double>(table.df_residual);

		if (q > 0) {
			// Same variance floor as the coefficient standard errors, so exact fits give a large finite F
			table.ms_regression = table.ss_regression / static_cast<double>(q);
			table.f_statistic = table.ms_regression / std::max(table.ms_error, CoefficientInference::kMinVariance);
			table.f_p_value = utils::f_pvalue(table.f_statistic, static_cast<double>(table.df_regression),
			                                  static_cast<double>(table.df_residual));
		}

		return table;
	}
};

} // namespace inference
} // namespace libnumfit
