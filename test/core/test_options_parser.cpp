#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libnumfit/core/fit_options.hpp>
#include <map>
#include <string>

using namespace libnumfit;
using namespace libnumfit::core;

using OptionMap = std::map<std::string, std::string>;

TEST_CASE("Options Parser: LOESS", "[options][parser]") {
	SECTION("empty map keeps defaults") {
		auto opts = LoessOptions::ParseFromMap(OptionMap());
		REQUIRE_THAT(opts.span, Catch::Matchers::WithinAbs(0.75, 1e-15));
		REQUIRE(opts.degree == 2);
	}

	SECTION("explicit values") {
		auto opts = LoessOptions::ParseFromMap({{"span", "0.4"}, {"degree", "1"}});
		REQUIRE_THAT(opts.span, Catch::Matchers::WithinAbs(0.4, 1e-15));
		REQUIRE(opts.degree == 1);
	}

	SECTION("out-of-range values are rejected") {
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"degree", "3"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"span", "1.5"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"degree", "99999999999999"}})), InvalidParameterError);
	}

	SECTION("malformed values are rejected") {
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"span", "wide"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"span", "0.5x"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"degree", "1.5"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"degree", ""}})), InvalidParameterError);
	}

	SECTION("unknown keys are rejected") {
		REQUIRE_THROWS_AS((LoessOptions::ParseFromMap({{"bandwidth", "3"}})), InvalidParameterError);
	}
}

TEST_CASE("Options Parser: KNN", "[options][parser]") {
	SECTION("explicit values") {
		auto opts = KnnOptions::ParseFromMap({{"k", "7"}, {"weighted", "false"}, {"epsilon", "1e-6"}});
		REQUIRE(opts.k == 7);
		REQUIRE_FALSE(opts.weighted);
		REQUIRE_THAT(opts.epsilon, Catch::Matchers::WithinAbs(1e-6, 1e-20));
	}

	SECTION("boolean spellings") {
		REQUIRE(KnnOptions::ParseFromMap({{"weighted", "TRUE"}}).weighted);
		REQUIRE(KnnOptions::ParseFromMap({{"weighted", "yes"}}).weighted);
		REQUIRE(KnnOptions::ParseFromMap({{"weighted", "1"}}).weighted);
		REQUIRE_FALSE(KnnOptions::ParseFromMap({{"weighted", "no"}}).weighted);
		REQUIRE_FALSE(KnnOptions::ParseFromMap({{"weighted", "0"}}).weighted);
		REQUIRE_THROWS_AS((KnnOptions::ParseFromMap({{"weighted", "maybe"}})), InvalidParameterError);
	}

	SECTION("invalid values are rejected") {
		REQUIRE_THROWS_AS((KnnOptions::ParseFromMap({{"k", "0"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((KnnOptions::ParseFromMap({{"k", "-2"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((KnnOptions::ParseFromMap({{"k", "three"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((KnnOptions::ParseFromMap({{"epsilon", "0"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((KnnOptions::ParseFromMap({{"metric", "manhattan"}})), InvalidParameterError);
	}

	SECTION("k is only checked against a training set at predict time") {
		auto opts = KnnOptions::ParseFromMap({{"k", "500"}});
		REQUIRE(opts.k == 500);
		REQUIRE_THROWS_AS(opts.Validate(100), InvalidParameterError);
	}
}

TEST_CASE("Options Parser: Linear Regression", "[options][parser]") {
	SECTION("explicit values") {
		auto opts = LinearRegressionOptions::ParseFromMap(
		    {{"method", "qr"}, {"interval", "both"}, {"level", "0.9"}, {"singular_tolerance", "1e-12"}});
		REQUIRE(opts.method == SolveMethod::QR);
		REQUIRE(opts.interval == IntervalKind::BOTH);
		REQUIRE_THAT(opts.level, Catch::Matchers::WithinAbs(0.9, 1e-15));
		REQUIRE_THAT(opts.EffectiveTolerance(), Catch::Matchers::WithinAbs(1e-12, 1e-24));
	}

	SECTION("unknown names fail without fallback") {
		REQUIRE_THROWS_AS((LinearRegressionOptions::ParseFromMap({{"method", "cholesky"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LinearRegressionOptions::ParseFromMap({{"interval", "all"}})), InvalidParameterError);
	}

	SECTION("level outside (0, 1)") {
		REQUIRE_THROWS_AS((LinearRegressionOptions::ParseFromMap({{"level", "95"}})), InvalidParameterError);
		REQUIRE_THROWS_AS((LinearRegressionOptions::ParseFromMap({{"level", "0"}})), InvalidParameterError);
	}

	SECTION("unknown keys are rejected") {
		REQUIRE_THROWS_AS((LinearRegressionOptions::ParseFromMap({{"intercept", "false"}})), InvalidParameterError);
	}
}
