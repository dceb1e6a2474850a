#include <catch2/catch_test_macros.hpp>

#include <libnumfit/utils/tracing.hpp>
#include <iostream>
#include <sstream>
#include <string>

using namespace libnumfit::utils;

namespace {

// Redirects std::cerr into a buffer for the lifetime of the object
class CerrCapture {
public:
	CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {
	}
	~CerrCapture() {
		std::cerr.rdbuf(previous_);
	}
	std::string str() const {
		return buffer_.str();
	}

private:
	std::ostringstream buffer_;
	std::streambuf *previous_;
};

// Restores the process-wide threshold when a test case ends
class ThresholdGuard {
public:
	explicit ThresholdGuard(LogLevel level) : saved_(Tracer::Threshold()) {
		Tracer::SetThreshold(level);
	}
	~ThresholdGuard() {
		Tracer::SetThreshold(saved_);
	}

private:
	LogLevel saved_;
};

} // namespace

TEST_CASE("Tracing: Level names", "[tracing]") {
	REQUIRE(Tracer::ParseLevel("trace", LogLevel::OFF) == LogLevel::TRACE);
	REQUIRE(Tracer::ParseLevel("DEBUG", LogLevel::OFF) == LogLevel::DBG);
	REQUIRE(Tracer::ParseLevel("Off", LogLevel::DBG) == LogLevel::OFF);
	REQUIRE(Tracer::ParseLevel("none", LogLevel::DBG) == LogLevel::OFF);
	REQUIRE(Tracer::ParseLevel("verbose", LogLevel::DBG) == LogLevel::DBG);
	REQUIRE(Tracer::ParseLevel("", LogLevel::TRACE) == LogLevel::TRACE);

	REQUIRE(std::string(Tracer::LevelName(LogLevel::DBG)) == "DEBUG");
	REQUIRE(std::string(Tracer::LevelName(LogLevel::TRACE)) == "TRACE");
}

TEST_CASE("Tracing: Threshold filtering", "[tracing]") {
	SECTION("debug hides trace") {
		ThresholdGuard guard(LogLevel::DBG);
		REQUIRE(Tracer::Enabled(LogLevel::DBG));
		REQUIRE_FALSE(Tracer::Enabled(LogLevel::TRACE));
	}

	SECTION("trace shows everything") {
		ThresholdGuard guard(LogLevel::TRACE);
		REQUIRE(Tracer::Enabled(LogLevel::TRACE));
		REQUIRE(Tracer::Enabled(LogLevel::DBG));
	}

	SECTION("off is silent and never a message level") {
		ThresholdGuard guard(LogLevel::OFF);
		REQUIRE_FALSE(Tracer::Enabled(LogLevel::DBG));
		Tracer::SetThreshold(LogLevel::TRACE);
		REQUIRE_FALSE(Tracer::Enabled(LogLevel::OFF));
	}
}

TEST_CASE("Tracing: Message format", "[tracing]") {
	ThresholdGuard guard(LogLevel::DBG);

	std::string output;
	{
		CerrCapture capture;
		NUMFIT_DEBUG("window=" << 5 << " h=" << 2);
		NUMFIT_TRACE("per-point detail");
		output = capture.str();
	}

	REQUIRE(output.find("[numfit DEBUG +") != std::string::npos);
	REQUIRE(output.find("ms] test_tracing.cpp:") != std::string::npos);
	REQUIRE(output.find(" window=5 h=2\n") != std::string::npos);
	REQUIRE(output.find("per-point detail") == std::string::npos);
}

TEST_CASE("Tracing: Stopwatch", "[tracing]") {
	SECTION("reports at debug level") {
		ThresholdGuard guard(LogLevel::DBG);

		std::string output;
		{
			CerrCapture capture;
			NUMFIT_TIMING_START();
			NUMFIT_TIMING_END("unit of work");
			output = capture.str();
		}
		REQUIRE(output.find("unit of work took ") != std::string::npos);
	}

	SECTION("silent when off but still measures") {
		ThresholdGuard guard(LogLevel::OFF);

		std::string output;
		double elapsed = -1.0;
		{
			CerrCapture capture;
			const Stopwatch watch;
			elapsed = watch.Report("quiet work", __FILE__, __LINE__);
			output = capture.str();
		}
		REQUIRE(elapsed >= 0.0);
		REQUIRE(output.empty());
	}
}
