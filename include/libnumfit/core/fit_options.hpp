#pragma once

#include "libnumfit/core/errors.hpp"
#include <cmath>
#include <cstdint>
#include <map>
#include <string>

namespace libnumfit {
namespace core {

/// Route used to solve the least-squares normal equations
enum class SolveMethod { INVERSE, QR };

/// Which interval bands to compute around the fitted values
enum class IntervalKind { NONE, CONFIDENCE, PREDICTION, BOTH };

/**
 * Map a method name ("inverse" or "qr") to a SolveMethod
 *
 * @throws InvalidParameterError for any other name (no fallback)
 */
inline SolveMethod ParseSolveMethod(const std::string &name) {
	if (name == "inverse") {
		return SolveMethod::INVERSE;
	}
	if (name == "qr") {
		return SolveMethod::QR;
	}
	throw InvalidParameterError("method must be 'inverse' or 'qr' (got '" + name + "')");
}

inline std::string SolveMethodName(SolveMethod method) {
	switch (method) {
	case SolveMethod::INVERSE:
		return "inverse";
	case SolveMethod::QR:
		return "qr";
	}
	return "unknown";
}

/**
 * Map an interval name ("none", "confidence", "prediction", "both") to an IntervalKind
 *
 * @throws InvalidParameterError for any other name
 */
inline IntervalKind ParseIntervalKind(const std::string &name) {
	if (name == "none") {
		return IntervalKind::NONE;
	}
	if (name == "confidence") {
		return IntervalKind::CONFIDENCE;
	}
	if (name == "prediction") {
		return IntervalKind::PREDICTION;
	}
	if (name == "both") {
		return IntervalKind::BOTH;
	}
	throw InvalidParameterError("interval must be 'none', 'confidence', 'prediction' or 'both' (got '" + name +
	                            "')");
}

inline std::string IntervalKindName(IntervalKind kind) {
	switch (kind) {
	case IntervalKind::NONE:
		return "none";
	case IntervalKind::CONFIDENCE:
		return "confidence";
	case IntervalKind::PREDICTION:
		return "prediction";
	case IntervalKind::BOTH:
		return "both";
	}
	return "unknown";
}

inline bool WantsConfidence(IntervalKind kind) {
	return kind == IntervalKind::CONFIDENCE || kind == IntervalKind::BOTH;
}

inline bool WantsPrediction(IntervalKind kind) {
	return kind == IntervalKind::PREDICTION || kind == IntervalKind::BOTH;
}

/**
 * Configuration for the LOESS smoother
 *
 * Design notes:
 * - span is the fraction of all points used in each local neighborhood
 * - degree is the degree of the local polynomial (1 = local linear, 2 = local quadratic)
 * - The window size floor(span * n) depends on the data, so the
 *   "enough neighbors" check happens at fit time, not in Validate()
 */
struct LoessOptions {
	/// Fraction of points in each neighborhood, strictly inside (0, 1)
	/// Default: 0.75
	double span = 0.75;

	/// Local polynomial degree, 1 or 2
	/// Default: 2
	int degree = 2;

	LoessOptions() = default;

	static LoessOptions Linear(double span_) {
		LoessOptions opts;
		opts.span = span_;
		opts.degree = 1;
		return opts;
	}

	static LoessOptions Quadratic(double span_) {
		LoessOptions opts;
		opts.span = span_;
		opts.degree = 2;
		return opts;
	}

	/**
	 * Parse options from textual key/value pairs
	 *
	 * Valid keys: span, degree
	 *
	 * @throws InvalidParameterError on unknown keys or malformed values
	 */
	static LoessOptions ParseFromMap(const std::map<std::string, std::string> &options_map);

	/**
	 * @throws InvalidParameterError if span or degree are out of range
	 */
	void Validate() const {
		if (degree != 1 && degree != 2) {
			throw InvalidParameterError("degree must be 1 or 2 (got " + std::to_string(degree) + ")");
		}
		if (!(span > 0.0 && span < 1.0)) {
			throw InvalidParameterError("span must be in (0, 1) (got " + std::to_string(span) + ")");
		}
	}
};

/**
 * Configuration for the distance-weighted k-nearest-neighbors predictor
 */
struct KnnOptions {
	/// Number of neighbors, 1 <= k <= n_train (checked at predict time)
	/// Default: 5
	size_t k = 5;

	/// Weight neighbors by inverse distance (true) or treat them equally (false)
	/// Default: true
	bool weighted = true;

	/// Offset added to distances before inversion so exact matches stay finite
	/// Default: 1e-8
	double epsilon = 1e-8;

	KnnOptions() = default;

	static KnnOptions Weighted(size_t k_) {
		KnnOptions opts;
		opts.k = k_;
		opts.weighted = true;
		return opts;
	}

	static KnnOptions Unweighted(size_t k_) {
		KnnOptions opts;
		opts.k = k_;
		opts.weighted = false;
		return opts;
	}

	/**
	 * Parse options from textual key/value pairs
	 *
	 * Valid keys: k, weighted, epsilon
	 */
	static KnnOptions ParseFromMap(const std::map<std::string, std::string> &options_map);

	/**
	 * Validate against the size of the training set
	 *
	 * @param n_train Number of training rows
	 * @throws InvalidParameterError if k is outside [1, n_train] or epsilon <= 0
	 */
	void Validate(size_t n_train) const {
		if (k < 1 || k > n_train) {
			throw InvalidParameterError("k must be in [1, " + std::to_string(n_train) + "] (got " +
			                            std::to_string(k) + ")");
		}
		if (!(epsilon > 0.0) || !std::isfinite(epsilon)) {
			throw InvalidParameterError("epsilon must be positive and finite (got " + std::to_string(epsilon) + ")");
		}
	}
};

/**
 * Configuration for the single-predictor OLS engine
 */
struct LinearRegressionOptions {
	/// Solution route for the normal equations
	/// Default: inverse
	SolveMethod method = SolveMethod::INVERSE;

	/// Bands computed around the fitted values
	/// Default: none
	IntervalKind interval = IntervalKind::NONE;

	/// Confidence level for all intervals, strictly inside (0, 1)
	/// Default: 0.95
	double level = 0.95;

	/// Relative tolerance for declaring X'X (or R) singular
	/// -1 = auto (1e-10)
	double singular_tolerance = -1.0;

	LinearRegressionOptions() = default;

	/// Convenience constructor from the textual names used by callers
	static LinearRegressionOptions FromNames(const std::string &method_, const std::string &interval_,
	                                         double level_ = 0.95) {
		LinearRegressionOptions opts;
		opts.method = ParseSolveMethod(method_);
		opts.interval = ParseIntervalKind(interval_);
		opts.level = level_;
		return opts;
	}

	/**
	 * Parse options from textual key/value pairs
	 *
	 * Valid keys: method, interval, level, singular_tolerance
	 */
	static LinearRegressionOptions ParseFromMap(const std::map<std::string, std::string> &options_map);

	double EffectiveTolerance() const {
		return singular_tolerance > 0.0 ? singular_tolerance : 1e-10;
	}

	/**
	 * @throws InvalidParameterError if level is outside (0, 1)
	 */
	void Validate() const {
		if (!(level > 0.0 && level < 1.0)) {
			throw InvalidParameterError("level must be in (0, 1) (got " + std::to_string(level) + ")");
		}
		if (std::isnan(singular_tolerance)) {
			throw InvalidParameterError("singular_tolerance must be a number");
		}
	}
};

} // namespace core
} // namespace libnumfit
