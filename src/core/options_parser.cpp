#include "libnumfit/core/fit_options.hpp"
#include "libnumfit/utils/tracing.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace libnumfit {
namespace core {

namespace {

double ParseDouble(const std::string &key, const std::string &text) {
	const char *begin = text.c_str();
	char *end = nullptr;
	double value = std::strtod(begin, &end);
	if (end == begin || *end != '\0') {
		throw InvalidParameterError("Option '" + key + "' must be a number (got '" + text + "')");
	}
	return value;
}

long long ParseInteger(const std::string &key, const std::string &text) {
	const char *begin = text.c_str();
	char *end = nullptr;
	long long value = std::strtoll(begin, &end, 10);
	if (end == begin || *end != '\0') {
		throw InvalidParameterError("Option '" + key + "' must be an integer (got '" + text + "')");
	}
	return value;
}

bool ParseBool(const std::string &key, const std::string &text) {
	std::string lowered = text;
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "true" || lowered == "1" || lowered == "yes") {
		return true;
	}
	if (lowered == "false" || lowered == "0" || lowered == "no") {
		return false;
	}
	throw InvalidParameterError("Option '" + key + "' must be a boolean (got '" + text + "')");
}

} // namespace

LoessOptions LoessOptions::ParseFromMap(const std::map<std::string, std::string> &options_map) {
	LoessOptions opts;

	for (const auto &entry : options_map) {
		const std::string &key = entry.first;
		const std::string &value = entry.second;

		if (key == "span") {
			opts.span = ParseDouble(key, value);
		} else if (key == "degree") {
			long long degree = ParseInteger(key, value);
			if (degree < std::numeric_limits<int>::min() || degree > std::numeric_limits<int>::max()) {
				throw InvalidParameterError("Option 'degree' is out of range (got '" + value + "')");
			}
			opts.degree = static_cast<int>(degree);
		} else {
			throw InvalidParameterError("Unknown option: '" + key + "'. Valid options are: span, degree");
		}
	}

	opts.Validate();
	NUMFIT_DEBUG("Parsed LOESS options: span=" << opts.span << " degree=" << opts.degree);
	return opts;
}

KnnOptions KnnOptions::ParseFromMap(const std::map<std::string, std::string> &options_map) {
	KnnOptions opts;

	for (const auto &entry : options_map) {
		const std::string &key = entry.first;
		const std::string &value = entry.second;

		if (key == "k") {
			long long k = ParseInteger(key, value);
			if (k < 1) {
				throw InvalidParameterError("Option 'k' must be at least 1 (got '" + value + "')");
			}
			opts.k = static_cast<size_t>(k);
		} else if (key == "weighted") {
			opts.weighted = ParseBool(key, value);
		} else if (key == "epsilon") {
			opts.epsilon = ParseDouble(key, value);
			if (!(opts.epsilon > 0.0)) {
				throw InvalidParameterError("Option 'epsilon' must be positive (got '" + value + "')");
			}
		} else {
			throw InvalidParameterError("Unknown option: '" + key + "'. Valid options are: k, weighted, epsilon");
		}
	}

	// k is checked against the training set size at predict time
	NUMFIT_DEBUG("Parsed KNN options: k=" << opts.k << " weighted=" << opts.weighted << " epsilon=" << opts.epsilon);
	return opts;
}

LinearRegressionOptions LinearRegressionOptions::ParseFromMap(const std::map<std::string, std::string> &options_map) {
	LinearRegressionOptions opts;

	for (const auto &entry : options_map) {
		const std::string &key = entry.first;
		const std::string &value = entry.second;

		if (key == "method") {
			opts.method = ParseSolveMethod(value);
		} else if (key == "interval") {
			opts.interval = ParseIntervalKind(value);
		} else if (key == "level") {
			opts.level = ParseDouble(key, value);
		} else if (key == "singular_tolerance") {
			opts.singular_tolerance = ParseDouble(key, value);
		} else {
			throw InvalidParameterError("Unknown option: '" + key +
			                            "'. Valid options are: method, interval, level, singular_tolerance");
		}
	}

	opts.Validate();
	NUMFIT_DEBUG("Parsed linear regression options: method=" << SolveMethodName(opts.method)
	                                                           << " interval=" << IntervalKindName(opts.interval)
	                                                           << " level=" << opts.level);
	return opts;
}

} // namespace core
} // namespace libnumfit
