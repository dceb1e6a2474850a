#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace libnumfit {
namespace core {

/**
 * Error taxonomy for libnumfit
 *
 * Every error raised by the numerical core derives from NumfitError so a
 * caller can catch the whole family in one place. Each concrete error also
 * derives from the matching standard exception, so existing handlers for
 * std::invalid_argument / std::runtime_error keep working.
 *
 * Errors are thrown synchronously at the point of detection and are never
 * swallowed inside the library. A failure for one point of a batch fit
 * aborts the whole fit.
 */
class NumfitError {
public:
	virtual ~NumfitError() = default;
};

/// Out-of-range or nonsensical hyperparameter (degree, span, k, level, method name, ...)
class InvalidParameterError : public std::invalid_argument, public NumfitError {
public:
	explicit InvalidParameterError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Feature / label / row-count mismatch between inputs
class DimensionMismatchError : public std::invalid_argument, public NumfitError {
public:
	explicit DimensionMismatchError(const std::string &message) : std::invalid_argument(message) {
	}

	static DimensionMismatchError Lengths(const std::string &what, size_t expected, size_t actual) {
		return DimensionMismatchError(what + ": expected " + std::to_string(expected) + ", got " +
		                              std::to_string(actual));
	}
};

/// Normal-equation matrix (or triangular factor) is not invertible
class SingularMatrixError : public std::runtime_error, public NumfitError {
public:
	explicit SingularMatrixError(const std::string &message) : std::runtime_error(message) {
	}
};

/// Neighborhood too small (or carrying no weight) for the requested fit
class InsufficientNeighborsError : public std::runtime_error, public NumfitError {
public:
	explicit InsufficientNeighborsError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace core
} // namespace libnumfit
