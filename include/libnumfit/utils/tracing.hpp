#pragma once

#include <chrono>
#include <sstream>
#include <string>

namespace libnumfit {
namespace utils {

/**
 * @brief Diagnostic output of the fitting routines
 *
 * The fits report their parameters at debug level and per-point detail at
 * trace level. Nothing is printed unless the threshold is lowered, either by
 * the environment variable NUMFIT_LOG_LEVEL (trace, debug, off) read on first
 * use, or by Tracer::SetThreshold().
 *
 * Line format on std::cerr:
 *   [numfit DEBUG +12.408ms] local_regression.hpp:184 LOESS fit: n=40 ...
 * where +12.408ms is the time since the first message of the process.
 */
enum class LogLevel { TRACE = 0, DBG = 1, OFF = 2 };

class Tracer {
public:
	static LogLevel Threshold();

	static void SetThreshold(LogLevel level);

	/// True when a message at this level passes the threshold
	static bool Enabled(LogLevel level);

	/**
	 * @brief Write one line to std::cerr (serialized across threads)
	 *
	 * @param level TRACE or DBG
	 * @param file __FILE__ of the caller; only the base name is printed
	 * @param line __LINE__ of the caller
	 * @param message Preformatted text
	 */
	static void Emit(LogLevel level, const char *file, int line, const std::string &message);

	/**
	 * @brief Level from its name, case-insensitive ("none" is accepted for off)
	 *
	 * @param fallback Returned for names that are not recognized
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	static const char *LevelName(LogLevel level);

	Tracer() = delete;
};

/**
 * @brief Wall time of one fit, reported at debug level
 */
class Stopwatch {
public:
	Stopwatch() : start_(std::chrono::steady_clock::now()) {
	}

	double ElapsedMs() const {
		return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
	}

	/// Logs "<what> took X ms" and returns X
	double Report(const char *what, const char *file, int line) const;

private:
	std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Macros
// ============================================================================

#define NUMFIT_LOG_AT(level, msg)                                                                                      \
	do {                                                                                                               \
		if (::libnumfit::utils::Tracer::Enabled(level)) {                                                              \
			std::ostringstream numfit_msg_;                                                                            \
			numfit_msg_ << msg;                                                                                        \
			::libnumfit::utils::Tracer::Emit(level, __FILE__, __LINE__, numfit_msg_.str());                            \
		}                                                                                                              \
	} while (0)

/// Usage: NUMFIT_DEBUG("window=" << window_size << " h=" << h)
#define NUMFIT_TRACE(msg) NUMFIT_LOG_AT(::libnumfit::utils::LogLevel::TRACE, msg)
#define NUMFIT_DEBUG(msg) NUMFIT_LOG_AT(::libnumfit::utils::LogLevel::DBG, msg)

/// One pair per scope: NUMFIT_TIMING_START(); ... NUMFIT_TIMING_END("KNN regression");
#define NUMFIT_TIMING_START() const ::libnumfit::utils::Stopwatch numfit_stopwatch_
#define NUMFIT_TIMING_END(what) numfit_stopwatch_.Report(what, __FILE__, __LINE__)

} // namespace utils
} // namespace libnumfit
