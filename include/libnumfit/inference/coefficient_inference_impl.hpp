#pragma once

#include "coefficient_inference.hpp"
#include "../core/errors.hpp"
#include <algorithm>

namespace libnumfit {
namespace inference {

// Implementation of CoefficientInference methods

inline Eigen::VectorXd CoefficientInference::ComputeStdErrors(double sigma_squared,
                                                              const Eigen::MatrixXd &xtx_inverse) {
	const Eigen::Index p = xtx_inverse.rows();
	Eigen::VectorXd std_errors(p);

	// Floor keeps standard errors positive for exact fits
	const double variance = std::max(sigma_squared, kMinVariance);

	for (Eigen::Index j = 0; j < p; j++) {
		const double diag = xtx_inverse(j, j);
		std_errors(j) = diag >= 0.0 ? std::sqrt(variance * diag) : std::numeric_limits<double>::quiet_NaN();
	}

	return std_errors;
}

inline Eigen::VectorXd CoefficientInference::ComputeTStatistics(const Eigen::VectorXd &coefficients,
                                                                const Eigen::VectorXd &std_errors) {
	const Eigen::Index p = coefficients.size();
	Eigen::VectorXd t_stats(p);

	for (Eigen::Index j = 0; j < p; j++) {
		if (std::isnan(coefficients(j)) || std::isnan(std_errors(j)) || std_errors(j) == 0.0) {
			t_stats(j) = std::numeric_limits<double>::quiet_NaN();
		} else {
			t_stats(j) = coefficients(j) / std_errors(j);
		}
	}

	return t_stats;
}

inline Eigen::VectorXd CoefficientInference::ComputePValues(const Eigen::VectorXd &t_statistics, size_t df) {
	const Eigen::Index p = t_statistics.size();
	Eigen::VectorXd p_values(p);

	for (Eigen::Index j = 0; j < p; j++) {
		if (std::isnan(t_statistics(j))) {
			p_values(j) = std::numeric_limits<double>::quiet_NaN();
		} else {
			p_values(j) = utils::student_t_pvalue(t_statistics(j), static_cast<double>(df));
		}
	}

	return p_values;
}

inline std::pair<Eigen::VectorXd, Eigen::VectorXd>
CoefficientInference::ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
                                                 const Eigen::MatrixXd &xtx_inverse, double ms_error, size_t df,
                                                 double confidence_level) {
	const Eigen::Index p = coefficients.size();

	const double alpha = 1.0 - confidence_level;
	const double t_crit = utils::student_t_critical(alpha / 2.0, static_cast<double>(df));

	Eigen::VectorXd ci_lower(p);
	Eigen::VectorXd ci_upper(p);

	for (Eigen::Index j = 0; j < p; j++) {
		const double half_width = t_crit * std::sqrt(ms_error * xtx_inverse(j, j));
		if (std::isnan(coefficients(j)) || std::isnan(half_width)) {
			ci_lower(j) = std::numeric_limits<double>::quiet_NaN();
			ci_upper(j) = std::numeric_limits<double>::quiet_NaN();
		} else {
			ci_lower(j) = coefficients(j) - half_width;
			ci_upper(j) = coefficients(j) + half_width;
		}
	}

	return {ci_lower, ci_upper};
}

inline core::CoefficientTable CoefficientInference::BuildTable(const Eigen::VectorXd &coefficients,
                                                               const Eigen::MatrixXd &xtx_inverse,
                                                               double sigma_squared, size_t df_t, double ms_error,
                                                               size_t df_ci, double confidence_level,
                                                               const std::vector<std::string> &names) {
	const size_t p = static_cast<size_t>(coefficients.size());
	if (static_cast<size_t>(xtx_inverse.rows()) != p || static_cast<size_t>(xtx_inverse.cols()) != p) {
		throw core::DimensionMismatchError("(X'X)^-1 must be " + std::to_string(p) + " x " + std::to_string(p));
	}
	if (names.size() != p) {
		throw core::DimensionMismatchError::Lengths("Coefficient names", p, names.size());
	}
	if (df_t == 0 || df_ci == 0) {
		throw core::DimensionMismatchError("Inference needs at least one residual degree of freedom");
	}

	core::CoefficientTable table(p, confidence_level);
	table.names = names;
	table.estimates = coefficients;
	table.std_errors = ComputeStdErrors(sigma_squared, xtx_inverse);
	table.t_statistics = ComputeTStatistics(coefficients, table.std_errors);
	table.p_values = ComputePValues(table.t_statistics, df_t);

	auto [ci_lower, ci_upper] = ComputeConfidenceIntervals(coefficients, xtx_inverse, ms_error, df_ci,
	                                                       confidence_level);
	table.ci_lower = ci_lower;
	table.ci_upper = ci_upper;
	table.degrees_of_freedom = df_t;

	return table;
}

} // namespace inference
} // namespace libnumfit
