#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace libnumfit {
namespace utils {

/**
 * Select the indices of the `count` smallest distances
 *
 * Indices are ordered by ascending distance. Equal distances keep their
 * original index order (stable sort), so the first occurrence wins at the
 * window boundary. NaN distances compare as larger than everything else.
 *
 * @param distances Distance of every candidate to the query point
 * @param count Number of indices to return (clamped to distances.size())
 * @return Candidate indices, nearest first
 */
inline std::vector<size_t> NearestIndices(const Eigen::VectorXd &distances, size_t count) {
	const size_t n = static_cast<size_t>(distances.size());
	std::vector<size_t> order(n);
	std::iota(order.begin(), order.end(), size_t(0));

	std::stable_sort(order.begin(), order.end(), [&distances](size_t lhs, size_t rhs) {
		const double dl = distances(static_cast<Eigen::Index>(lhs));
		const double dr = distances(static_cast<Eigen::Index>(rhs));
		if (std::isnan(dr)) {
			return !std::isnan(dl);
		}
		return dl < dr;
	});

	order.resize(std::min(count, n));
	return order;
}

} // namespace utils
} // namespace libnumfit
