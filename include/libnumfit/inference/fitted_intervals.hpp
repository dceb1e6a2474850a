#pragma once

#include "../core/errors.hpp"
#include "../core/fit_options.hpp"
#include "../core/linear_fit_result.hpp"
#include "../utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>

namespace libnumfit {
namespace inference {

/**
 * Confidence and prediction bands for a single-predictor linear fit
 *
 * For an abscissa x with point estimate ŷ:
 *   confidence: ŷ ± t(1-α/2, df) · σ̂ · sqrt(    1/n + (x - x̄)² / ((n-1)·Var(x)))
 *   prediction: ŷ ± t(1-α/2, df) · σ̂ · sqrt(1 + 1/n + (x - x̄)² / ((n-1)·Var(x)))
 *
 * x̄ and Var(x) always come from the sample the model was fitted on; the
 * evaluation abscissae may be the sample itself or new points.
 */
class FittedIntervals {
public:
	/**
	 * @param sample_x Predictor values the model was fitted on (length n)
	 * @param eval_x Abscissae to evaluate the bands at
	 * @param eval_fitted Point estimates at eval_x
	 * @param sigma Residual standard error σ̂
	 * @param df Residual degrees of freedom
	 * @param level Confidence level in (0, 1)
	 * @param kind Which bands to compute
	 */
	static core::IntervalTable Compute(const Eigen::VectorXd &sample_x, const Eigen::VectorXd &eval_x,
	                                   const Eigen::VectorXd &eval_fitted, double sigma, size_t df, double level,
	                                   core::IntervalKind kind) {
		if (eval_x.size() != eval_fitted.size()) {
			throw core::DimensionMismatchError::Lengths("Fitted values for interval evaluation",
			                                            static_cast<size_t>(eval_x.size()),
			                                            static_cast<size_t>(eval_fitted.size()));
		}
		if (!(level > 0.0 && level < 1.0)) {
			throw core::InvalidParameterError("level must be in (0, 1) (got " + std::to_string(level) + ")");
		}

		core::IntervalTable table;
		table.x = eval_x;
		table.fitted = eval_fitted;
		table.confidence_level = level;
		table.degrees_of_freedom = df;
		table.has_confidence = core::WantsConfidence(kind);
		table.has_prediction = core::WantsPrediction(kind);

		if (!table.has_confidence && !table.has_prediction) {
			return table;
		}
		if (df == 0) {
			throw core::DimensionMismatchError("Intervals need at least one residual degree of freedom");
		}

		const double n = static_cast<double>(sample_x.size());
		const double x_mean = sample_x.mean();
		// (n - 1) · Var(x)
		const double sxx = (sample_x.array() - x_mean).square().sum();
		if (!(sxx > 0.0)) {
			throw core::SingularMatrixError("Intervals undefined: predictor has zero variance");
		}

		const double t_crit = utils::student_t_critical((1.0 - level) / 2.0, static_cast<double>(df));

		const Eigen::ArrayXd leverage = 1.0 / n + (eval_x.array() - x_mean).square() / sxx;

		if (table.has_confidence) {
			const Eigen::ArrayXd half_width = t_crit * sigma * leverage.sqrt();
			table.confidence_lower = eval_fitted.array() - half_width;
			table.confidence_upper = eval_fitted.array() + half_width;
		}
		if (table.has_prediction) {
			const Eigen::ArrayXd half_width = t_crit * sigma * (1.0 + leverage).sqrt();
			table.prediction_lower = eval_fitted.array() - half_width;
			table.prediction_upper = eval_fitted.array() + half_width;
		}

		return table;
	}
};

} // namespace inference
} // namespace libnumfit
