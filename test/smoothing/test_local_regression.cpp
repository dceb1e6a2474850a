#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libnumfit/smoothing/local_regression.hpp>
#include <Eigen/Dense>
#include <limits>

using namespace libnumfit;
using namespace libnumfit::core;
using namespace libnumfit::smoothing;

const double TOLERANCE = 1e-9;

namespace {

Eigen::VectorXd unit_grid(int n) {
	Eigen::VectorXd x(n);
	for (int i = 0; i < n; i++) {
		x(i) = static_cast<double>(i) / static_cast<double>(n);
	}
	return x;
}

} // namespace

TEST_CASE("LOESS: Local linear reproduces a straight line", "[loess][properties]") {
	const Eigen::VectorXd x = unit_grid(20);
	const Eigen::VectorXd y = (2.0 + 3.0 * x.array()).matrix();

	auto result = LocalRegression::Fit(x, y, LoessOptions::Linear(0.3));

	REQUIRE(result.window_size == 6);
	REQUIRE(result.bandwidth == 3);
	for (Eigen::Index i = 0; i < x.size(); i++) {
		REQUIRE_THAT(result.fitted_values(i), Catch::Matchers::WithinAbs(y(i), TOLERANCE));
	}
	REQUIRE_THAT(result.sse, Catch::Matchers::WithinAbs(0.0, 1e-15));
}

TEST_CASE("LOESS: Local quadratic reproduces a parabola", "[loess][properties]") {
	const Eigen::VectorXd x = unit_grid(20);
	const Eigen::VectorXd y = (1.0 - 2.0 * x.array() + 4.0 * x.array().square()).matrix();

	auto result = LocalRegression::Fit(x, y, LoessOptions::Quadratic(0.4));

	for (Eigen::Index i = 0; i < x.size(); i++) {
		REQUIRE_THAT(result.fitted_values(i), Catch::Matchers::WithinAbs(y(i), 1e-8));
	}
}

TEST_CASE("LOESS: Reference values", "[loess][validation]") {
	Eigen::VectorXd x(10), y(10);
	x << 0.0, 0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8, 0.9;
	y << 1.2, 0.8, 1.9, 2.4, 2.1, 3.3, 3.0, 4.1, 3.7, 4.6;

	SECTION("degree 1") {
		auto result = LocalRegression::Fit(x, y, LoessOptions::Linear(0.5));

		Eigen::VectorXd expected(10);
		expected << 0.9987013257076814, 1.3398397603371595, 1.6800480272903906, 2.1000750393567857,
		    2.5400614807723954, 2.979740465774835, 3.2403390580759517, 3.7398064835924245, 4.070065757123141,
		    4.4008953200272485;

		REQUIRE(result.window_size == 5);
		REQUIRE(result.bandwidth == 2);
		for (Eigen::Index i = 0; i < 10; i++) {
			REQUIRE_THAT(result.fitted_values(i), Catch::Matchers::WithinAbs(expected(i), TOLERANCE));
		}
		REQUIRE_THAT(result.sse, Catch::Matchers::WithinAbs(1.130595821831186, TOLERANCE));
		REQUIRE_THAT(result.mse, Catch::Matchers::WithinAbs(0.1130595821831186, TOLERANCE));
	}

	SECTION("degree 2") {
		auto result = LocalRegression::Fit(x, y, LoessOptions::Quadratic(0.5));

		Eigen::VectorXd expected(10);
		expected << 0.94388201699925, 1.3680504971481613, 1.737184758856173, 2.1857694195475945,
		    2.5541688305590893, 2.7944158301323334, 3.4970149466496734, 3.611554276568506, 4.005954856022047,
		    4.5280390449505585;

		for (Eigen::Index i = 0; i < 10; i++) {
			REQUIRE_THAT(result.fitted_values(i), Catch::Matchers::WithinAbs(expected(i), 1e-8));
		}
		REQUIRE_THAT(result.sse, Catch::Matchers::WithinAbs(1.506955847255323, 1e-8));
	}
}

TEST_CASE("LOESS: Calendar-year abscissae", "[loess][conditioning]") {
	const Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(40, 1980.0, 2019.0);
	const Eigen::VectorXd line = (0.1 * x.array()).matrix();
	const Eigen::VectorXd parabola = (5.0 + 0.02 * (x.array() - 2000.0).square()).matrix();

	auto linear = LocalRegression::Fit(x, line, LoessOptions::Linear(0.5));
	auto quadratic = LocalRegression::Fit(x, parabola, LoessOptions::Quadratic(0.5));

	REQUIRE(linear.window_size == 20);
	REQUIRE(linear.bandwidth == 10);
	for (Eigen::Index i = 0; i < x.size(); i++) {
		REQUIRE_THAT(linear.fitted_values(i), Catch::Matchers::WithinAbs(line(i), 1e-8));
		REQUIRE_THAT(quadratic.fitted_values(i), Catch::Matchers::WithinAbs(parabola(i), 1e-8));
	}

	// Shifting the abscissae leaves the smooth unchanged
	const Eigen::VectorXd shifted = (x.array() - 1980.0).matrix();
	auto reference = LocalRegression::Fit(shifted, parabola, LoessOptions::Quadratic(0.5));
	for (Eigen::Index i = 0; i < x.size(); i++) {
		REQUIRE_THAT(quadratic.fitted_values(i), Catch::Matchers::WithinAbs(reference.fitted_values(i), 1e-9));
	}
}

TEST_CASE("LOESS: Residuals and error metrics", "[loess][properties]") {
	const Eigen::VectorXd x = unit_grid(30);
	Eigen::VectorXd y(30);
	for (int i = 0; i < 30; i++) {
		y(i) = std::sin(6.0 * x(i)) + ((i % 3) - 1) * 0.1;
	}

	auto result = LocalRegression::Fit(x, y);

	REQUIRE(result.n_obs == 30);
	REQUIRE(result.degree == 2);
	REQUIRE_THAT(result.span, Catch::Matchers::WithinAbs(0.75, 1e-15));

	for (Eigen::Index i = 0; i < 30; i++) {
		REQUIRE_THAT(result.residuals(i), Catch::Matchers::WithinAbs(y(i) - result.fitted_values(i), 1e-15));
	}
	REQUIRE_THAT(result.sse, Catch::Matchers::WithinAbs(result.residuals.squaredNorm(), 1e-15));
	REQUIRE_THAT(result.mse, Catch::Matchers::WithinAbs(result.sse / 30.0, 1e-15));
	REQUIRE_THAT(result.rmse(), Catch::Matchers::WithinAbs(std::sqrt(result.mse), 1e-15));
}

TEST_CASE("LOESS: Window wider than the kernel gives zero weights", "[loess][edge]") {
	// Integer spacing with h = 2: neighbors at distance >= 2 get weight 0
	Eigen::VectorXd x(10), y(10);
	x << 0, 1, 2, 3, 4, 5, 6, 7, 8, 9;
	y << 4.0, 1.0, 7.0, 3.0, 8.0, 2.0, 6.0, 5.0, 9.0, 0.5;

	auto result = LocalRegression::Fit(x, y, LoessOptions::Linear(0.5));

	REQUIRE(result.bandwidth == 2);
	// At x = 0 only (0, y0) and (1, y1) carry weight: the local line passes through y0
	REQUIRE_THAT(result.fitted_values(0), Catch::Matchers::WithinAbs(y(0), 1e-10));
	REQUIRE_THAT(result.fitted_values(9), Catch::Matchers::WithinAbs(y(9), 1e-10));

	// Two weighted points cannot support a local quadratic
	REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, LoessOptions::Quadratic(0.5)), SingularMatrixError);
}

TEST_CASE("LOESS: Evaluate at sample points matches Fit", "[loess][evaluate]") {
	Eigen::VectorXd x(10), y(10);
	x << 0.0, 0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8, 0.9;
	y << 1.2, 0.8, 1.9, 2.4, 2.1, 3.3, 3.0, 4.1, 3.7, 4.6;

	auto options = LoessOptions::Quadratic(0.6);
	auto fit = LocalRegression::Fit(x, y, options);
	auto curve = LocalRegression::Evaluate(x, y, x, options);

	REQUIRE(curve.window_size == fit.window_size);
	REQUIRE(curve.bandwidth == fit.bandwidth);
	for (Eigen::Index i = 0; i < x.size(); i++) {
		REQUIRE_THAT(curve.fitted_values(i), Catch::Matchers::WithinAbs(fit.fitted_values(i), 1e-14));
	}
}

TEST_CASE("LOESS: Evaluate on a grid", "[loess][evaluate]") {
	const Eigen::VectorXd x = unit_grid(25);
	const Eigen::VectorXd y = (0.5 + x.array()).matrix();

	const Eigen::VectorXd grid = LocalRegression::MakeGrid(0.0, 0.95, 40);
	auto curve = LocalRegression::Evaluate(x, y, grid, LoessOptions::Linear(0.4));

	REQUIRE(curve.query_x.size() == 40);
	REQUIRE(curve.fitted_values.size() == 40);
	for (Eigen::Index q = 0; q < grid.size(); q++) {
		REQUIRE_THAT(curve.fitted_values(q), Catch::Matchers::WithinAbs(0.5 + grid(q), TOLERANCE));
	}
}

TEST_CASE("LOESS: MakeGrid", "[loess][evaluate]") {
	auto grid = LocalRegression::MakeGrid(-1.0, 1.0, 5);
	REQUIRE(grid.size() == 5);
	REQUIRE_THAT(grid(0), Catch::Matchers::WithinAbs(-1.0, 1e-15));
	REQUIRE_THAT(grid(2), Catch::Matchers::WithinAbs(0.0, 1e-15));
	REQUIRE_THAT(grid(4), Catch::Matchers::WithinAbs(1.0, 1e-15));

	REQUIRE_THROWS_AS(LocalRegression::MakeGrid(0.0, 1.0, 1), InvalidParameterError);
	REQUIRE_THROWS_AS(LocalRegression::MakeGrid(1.0, 1.0, 10), InvalidParameterError);
	REQUIRE_THROWS_AS(LocalRegression::MakeGrid(2.0, 1.0, 10), InvalidParameterError);
}

TEST_CASE("LOESS: Kernel and window helpers", "[loess][kernel]") {
	REQUIRE_THAT(LocalRegression::TricubeWeight(0.0), Catch::Matchers::WithinAbs(1.0, 1e-15));
	REQUIRE_THAT(LocalRegression::TricubeWeight(0.5), Catch::Matchers::WithinAbs(0.669921875, 1e-15));
	REQUIRE_THAT(LocalRegression::TricubeWeight(-0.5), Catch::Matchers::WithinAbs(0.669921875, 1e-15));
	REQUIRE_THAT(LocalRegression::TricubeWeight(1.0), Catch::Matchers::WithinAbs(0.0, 1e-15));
	REQUIRE_THAT(LocalRegression::TricubeWeight(1.5), Catch::Matchers::WithinAbs(0.0, 1e-15));

	REQUIRE(LocalRegression::WindowSize(0.75, 10) == 7);
	REQUIRE(LocalRegression::WindowSize(0.5, 7) == 3);
}

TEST_CASE("LOESS: Invalid arguments", "[loess][errors]") {
	const Eigen::VectorXd x = unit_grid(10);
	const Eigen::VectorXd y = x;

	SECTION("degree outside {1, 2}") {
		LoessOptions opts;
		opts.degree = 3;
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, opts), InvalidParameterError);
		opts.degree = 0;
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, opts), InvalidParameterError);
	}

	SECTION("span outside (0, 1)") {
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, LoessOptions::Linear(0.0)), InvalidParameterError);
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, LoessOptions::Linear(1.0)), InvalidParameterError);
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, LoessOptions::Linear(-0.2)), InvalidParameterError);
	}

	SECTION("window too small for the degree") {
		// floor(0.25 * 10) = 2 < 3
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, LoessOptions::Quadratic(0.25)), InsufficientNeighborsError);
		// floor(0.15 * 10) = 1 < 2
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, y, LoessOptions::Linear(0.15)), InsufficientNeighborsError);
	}

	SECTION("length mismatch") {
		Eigen::VectorXd short_y = y.head(7);
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, short_y), DimensionMismatchError);
	}

	SECTION("non-finite input") {
		Eigen::VectorXd bad = y;
		bad(4) = std::numeric_limits<double>::infinity();
		REQUIRE_THROWS_AS(LocalRegression::Fit(x, bad), InvalidParameterError);

		Eigen::VectorXd query(1);
		query << std::numeric_limits<double>::quiet_NaN();
		REQUIRE_THROWS_AS(LocalRegression::Evaluate(x, y, query), InvalidParameterError);
	}

	SECTION("coincident abscissae make the local system singular") {
		Eigen::VectorXd flat = Eigen::VectorXd::Constant(10, 0.5);
		REQUIRE_THROWS_AS(LocalRegression::Fit(flat, y, LoessOptions::Linear(0.5)), SingularMatrixError);
	}
}
