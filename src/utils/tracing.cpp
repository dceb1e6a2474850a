#include "libnumfit/utils/tracing.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace libnumfit {
namespace utils {

namespace {

using Clock = std::chrono::steady_clock;

LogLevel LevelFromEnvironment() {
	const char *value = std::getenv("NUMFIT_LOG_LEVEL");
	return value == nullptr ? LogLevel::OFF : Tracer::ParseLevel(value, LogLevel::OFF);
}

// Function-local statics: initialized on first use, safe across threads
std::atomic<int> &ThresholdSlot() {
	static std::atomic<int> slot(static_cast<int>(LevelFromEnvironment()));
	return slot;
}

Clock::time_point Epoch() {
	static const Clock::time_point epoch = Clock::now();
	return epoch;
}

std::mutex &SinkMutex() {
	static std::mutex mutex;
	return mutex;
}

const char *BaseName(const char *path) {
	const char *slash = std::strrchr(path, '/');
	const char *backslash = std::strrchr(path, '\\');
	const char *last = slash > backslash ? slash : backslash;
	return last == nullptr ? path : last + 1;
}

} // namespace

LogLevel Tracer::Threshold() {
	return static_cast<LogLevel>(ThresholdSlot().load(std::memory_order_relaxed));
}

void Tracer::SetThreshold(LogLevel level) {
	ThresholdSlot().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Tracer::Enabled(LogLevel level) {
	return level != LogLevel::OFF && static_cast<int>(level) >= ThresholdSlot().load(std::memory_order_relaxed);
}

LogLevel Tracer::ParseLevel(const std::string &name, LogLevel fallback) {
	std::string lowered;
	lowered.reserve(name.size());
	for (char c : name) {
		lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}

	if (lowered == "trace") {
		return LogLevel::TRACE;
	}
	if (lowered == "debug") {
		return LogLevel::DBG;
	}
	if (lowered == "off" || lowered == "none") {
		return LogLevel::OFF;
	}
	return fallback;
}

const char *Tracer::LevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::OFF:
		return "OFF";
	}
	return "?";
}

void Tracer::Emit(LogLevel level, const char *file, int line, const std::string &message) {
	const double since_start = std::chrono::duration<double, std::milli>(Clock::now() - Epoch()).count();

	std::ostringstream out;
	out << "[numfit " << LevelName(level) << " +" << std::fixed << std::setprecision(3) << since_start << "ms] "
	    << BaseName(file) << ":" << line << " " << message << '\n';

	std::lock_guard<std::mutex> lock(SinkMutex());
	std::cerr << out.str();
}

double Stopwatch::Report(const char *what, const char *file, int line) const {
	const double elapsed = ElapsedMs();
	if (Tracer::Enabled(LogLevel::DBG)) {
		std::ostringstream msg;
		msg << what << " took " << std::fixed << std::setprecision(3) << elapsed << " ms";
		Tracer::Emit(LogLevel::DBG, file, line, msg.str());
	}
	return elapsed;
}

} // namespace utils
} // namespace libnumfit
