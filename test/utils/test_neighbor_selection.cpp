#include <catch2/catch_test_macros.hpp>

#include <libnumfit/utils/neighbor_selection.hpp>
#include <Eigen/Dense>
#include <limits>
#include <vector>

using namespace libnumfit::utils;

TEST_CASE("Neighbor Selection: Ascending distance order", "[neighbors][selection]") {
	Eigen::VectorXd d(5);
	d << 3.0, 0.5, 2.0, 0.1, 9.0;

	REQUIRE(NearestIndices(d, 3) == std::vector<size_t>{3, 1, 2});
	REQUIRE(NearestIndices(d, 5) == std::vector<size_t>{3, 1, 2, 0, 4});
}

TEST_CASE("Neighbor Selection: Ties keep index order", "[neighbors][selection][ties]") {
	Eigen::VectorXd d(6);
	d << 1.0, 2.0, 1.0, 0.0, 2.0, 1.0;

	REQUIRE(NearestIndices(d, 4) == std::vector<size_t>{3, 0, 2, 5});
	// The boundary tie between indices 1 and 4 goes to the lower index
	REQUIRE(NearestIndices(d, 5) == std::vector<size_t>{3, 0, 2, 5, 1});
}

TEST_CASE("Neighbor Selection: Count clamps to the candidate set", "[neighbors][selection]") {
	Eigen::VectorXd d(2);
	d << 4.0, 1.0;

	REQUIRE(NearestIndices(d, 10) == std::vector<size_t>{1, 0});
	REQUIRE(NearestIndices(d, 0).empty());
	REQUIRE(NearestIndices(Eigen::VectorXd(), 3).empty());
}

TEST_CASE("Neighbor Selection: NaN distances sort last", "[neighbors][selection]") {
	Eigen::VectorXd d(4);
	d << std::numeric_limits<double>::quiet_NaN(), 2.0, std::numeric_limits<double>::infinity(), 1.0;

	REQUIRE(NearestIndices(d, 4) == std::vector<size_t>{3, 1, 2, 0});
}
