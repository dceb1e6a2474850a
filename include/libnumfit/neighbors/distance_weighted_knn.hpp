#pragma once

#include "libnumfit/core/errors.hpp"
#include "libnumfit/core/fit_options.hpp"
#include "libnumfit/core/knn_result.hpp"
#include "libnumfit/utils/neighbor_selection.hpp"
#include "libnumfit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace libnumfit {
namespace neighbors {

/**
 * Distance-weighted k-nearest-neighbors predictor
 *
 * Algorithm:
 * 1. Euclidean distance matrix D (n_train × n_test) over all feature columns
 * 2. Per test point: the k nearest training rows (stable, ties by index)
 * 3. weighted:   w_j = 1 / (d_j + ε), non-finite weights become 0
 *    unweighted: w_j = 1
 * 4. Regression:     Σ(w·y) / Σ(w)
 *    Classification: label with the largest summed weight; a tie goes to the
 *                    label that sorts first (the confusion-matrix order)
 *
 * Optional test responses / labels produce error metrics alongside the
 * predictions.
 *
 * Design notes:
 * - Header-only, stateless (all methods are static)
 * - Features are used unscaled
 * - D is built once and only read by the per-test-point loop
 */
class DistanceWeightedKNN {
public:
	/**
	 * Regression prediction
	 *
	 * @param train_X Training features (n_train × p)
	 * @param test_X Query features (n_test × p)
	 * @param train_y Continuous training responses (length n_train)
	 * @param options k, weighted, epsilon
	 * @return KnnRegressionResult with predictions and neighborhoods
	 *
	 * @throws core::InvalidParameterError if k is outside [1, n_train], epsilon <= 0 or an input is non-finite
	 * @throws core::DimensionMismatchError for row / column count mismatches
	 * @throws core::InsufficientNeighborsError if every neighbor weight is zero
	 */
	static core::KnnRegressionResult Predict(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X,
	                                         const Eigen::VectorXd &train_y,
	                                         const core::KnnOptions &options = core::KnnOptions());

	/**
	 * Regression prediction scored against true test responses
	 *
	 * Fills residuals (y_true - prediction), SSE, MSE and RMSE.
	 */
	static core::KnnRegressionResult Predict(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X,
	                                         const Eigen::VectorXd &train_y, const core::KnnOptions &options,
	                                         const Eigen::VectorXd &test_y);

	/**
	 * Classification prediction
	 *
	 * @param train_labels Categorical training labels (length n_train)
	 */
	static core::KnnClassificationResult Predict(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X,
	                                             const std::vector<std::string> &train_labels,
	                                             const core::KnnOptions &options = core::KnnOptions());

	/**
	 * Classification prediction scored against true test labels
	 *
	 * Fills accuracy, error rate and the confusion matrix.
	 */
	static core::KnnClassificationResult Predict(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X,
	                                             const std::vector<std::string> &train_labels,
	                                             const core::KnnOptions &options,
	                                             const std::vector<std::string> &test_labels);

	/**
	 * Euclidean distances between every training row and every test row
	 *
	 * @return Matrix D with D(i, j) = ||train_X.row(i) - test_X.row(j)||
	 */
	static Eigen::MatrixXd ComputeDistanceMatrix(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X);

	/**
	 * Neighbors of one test point with their weights
	 *
	 * @param distances Distance matrix from ComputeDistanceMatrix()
	 * @param test_index Column of the test point in distances
	 */
	static core::Neighborhood SelectNeighborhood(const Eigen::MatrixXd &distances, Eigen::Index test_index,
	                                             const core::KnnOptions &options);

	/// Weighted mean of the neighbor responses
	static double AverageResponse(const core::Neighborhood &neighborhood, const Eigen::VectorXd &train_y);

	/// Label with the largest summed weight (lexicographically smallest wins ties)
	static std::string VoteLabel(const core::Neighborhood &neighborhood, const std::vector<std::string> &train_labels);

private:
	static void ValidateShapes(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X, size_t n_labels);

	static void ScoreRegression(core::KnnRegressionResult &result, const Eigen::VectorXd &test_y);

	static void ScoreClassification(core::KnnClassificationResult &result,
	                                const std::vector<std::string> &test_labels);

	static double TotalWeight(const core::Neighborhood &neighborhood);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void DistanceWeightedKNN::ValidateShapes(const Eigen::MatrixXd &train_X, const Eigen::MatrixXd &test_X,
                                                size_t n_labels) {
	if (static_cast<size_t>(train_X.rows()) != n_labels) {
		throw core::DimensionMismatchError::Lengths("Training labels must match training rows",
		                                            static_cast<size_t>(train_X.rows()), n_labels);
	}
	if (train_X.cols() != test_X.cols()) {
		throw core::DimensionMismatchError::Lengths("Test feature columns must match training feature columns",
		                                            static_cast<size_t>(train_X.cols()),
		                                            static_cast<size_t>(test_X.cols()));
	}
	if (!train_X.allFinite() || !test_X.allFinite()) {
		throw core::InvalidParameterError("Features must be finite");
	}
}

inline Eigen::MatrixXd DistanceWeightedKNN::ComputeDistanceMatrix(const Eigen::MatrixXd &train_X,
                                                                  const Eigen::MatrixXd &test_X) {
	if (train_X.cols() != test_X.cols()) {
		throw core::DimensionMismatchError::Lengths("Test feature columns must match training feature columns",
		                                            static_cast<size_t>(train_X.cols()),
		                                            static_cast<size_t>(test_X.cols()));
	}

	Eigen::MatrixXd distances(train_X.rows(), test_X.rows());
	for (Eigen::Index j = 0; j < test_X.rows(); j++) {
		for (Eigen::Index i = 0; i < train_X.rows(); i++) {
			distances(i, j) = (train_X.row(i) - test_X.row(j)).norm();
		}
	}
	return distances;
}

inline core::Neighborhood DistanceWeightedKNN::SelectNeighborhood(const Eigen::MatrixXd &distances,
                                                                  Eigen::Index test_index,
                                                                  const core::KnnOptions &options) {
	const Eigen::VectorXd column = distances.col(test_index);

	core::Neighborhood neighborhood;
	neighborhood.indices = utils::NearestIndices(column, options.k);
	neighborhood.distances.reserve(neighborhood.indices.size());
	neighborhood.weights.reserve(neighborhood.indices.size());

	for (size_t idx : neighborhood.indices) {
		const double d = column(static_cast<Eigen::Index>(idx));
		neighborhood.distances.push_back(d);

		if (!options.weighted) {
			neighborhood.weights.push_back(1.0);
			continue;
		}
		const double w = 1.0 / (d + options.epsilon);
		neighborhood.weights.push_back(std::isfinite(w) ? w : 0.0);
	}

	return neighborhood;
}

inline double DistanceWeightedKNN::TotalWeight(const core::Neighborhood &neighborhood) {
	double total = 0.0;
	for (double w : neighborhood.weights) {
		total += w;
	}
	if (!(total > 0.0) || !std::isfinite(total)) {
		throw core::InsufficientNeighborsError("All " + std::to_string(neighborhood.weights.size()) +
		                                       " neighbor weights are zero or non-finite");
	}
	return total;
}

inline double DistanceWeightedKNN::AverageResponse(const core::Neighborhood &neighborhood,
                                                   const Eigen::VectorXd &train_y) {
	const double total = TotalWeight(neighborhood);

	double weighted_sum = 0.0;
	for (size_t r = 0; r < neighborhood.indices.size(); r++) {
		weighted_sum += neighborhood.weights[r] * train_y(static_cast<Eigen::Index>(neighborhood.indices[r]));
	}
	return weighted_sum / total;
}

inline std::string DistanceWeightedKNN::VoteLabel(const core::Neighborhood &neighborhood,
                                                  const std::vector<std::string> &train_labels) {
	TotalWeight(neighborhood);

	// Tallies keyed in sorted label order
	std::map<std::string, double> tallies;
	for (size_t r = 0; r < neighborhood.indices.size(); r++) {
		tallies[train_labels[neighborhood.indices[r]]] += neighborhood.weights[r];
	}

	// Strict comparison: on a tie the label that sorts first wins
	auto best = tallies.begin();
	for (auto it = tallies.begin(); it != tallies.end(); ++it) {
		if (it->second > best->second) {
			best = it;
		}
	}
	return best->first;
}

inline core::KnnRegressionResult DistanceWeightedKNN::Predict(const Eigen::MatrixXd &train_X,
                                                              const Eigen::MatrixXd &test_X,
                                                              const Eigen::VectorXd &train_y,
                                                              const core::KnnOptions &options) {
	options.Validate(static_cast<size_t>(train_X.rows()));
	ValidateShapes(train_X, test_X, static_cast<size_t>(train_y.size()));
	if (!train_y.allFinite()) {
		throw core::InvalidParameterError("Training responses must be finite");
	}

	NUMFIT_DEBUG("KNN regression: n_train=" << train_X.rows() << " n_test=" << test_X.rows()
	                                        << " features=" << train_X.cols() << " k=" << options.k
	                                        << " weighted=" << (options.weighted ? "true" : "false"));
	NUMFIT_TIMING_START();

	const Eigen::MatrixXd distances = ComputeDistanceMatrix(train_X, test_X);

	core::KnnRegressionResult result;
	result.k = options.k;
	result.weighted = options.weighted;
	result.predictions.resize(test_X.rows());
	result.neighborhoods.reserve(static_cast<size_t>(test_X.rows()));

	for (Eigen::Index j = 0; j < test_X.rows(); j++) {
		core::Neighborhood neighborhood = SelectNeighborhood(distances, j, options);
		result.predictions(j) = AverageResponse(neighborhood, train_y);
		NUMFIT_TRACE("test row " << j << ": nearest train row " << neighborhood.indices.front() << " at distance "
		                          << neighborhood.distances.front() << ", prediction " << result.predictions(j));
		result.neighborhoods.push_back(std::move(neighborhood));
	}

	NUMFIT_TIMING_END("KNN regression");
	return result;
}

inline core::KnnRegressionResult DistanceWeightedKNN::Predict(const Eigen::MatrixXd &train_X,
                                                              const Eigen::MatrixXd &test_X,
                                                              const Eigen::VectorXd &train_y,
                                                              const core::KnnOptions &options,
                                                              const Eigen::VectorXd &test_y) {
	if (test_y.size() != test_X.rows()) {
		throw core::DimensionMismatchError::Lengths("Test responses must match test rows",
		                                            static_cast<size_t>(test_X.rows()),
		                                            static_cast<size_t>(test_y.size()));
	}
	core::KnnRegressionResult result = Predict(train_X, test_X, train_y, options);
	ScoreRegression(result, test_y);
	return result;
}

inline core::KnnClassificationResult DistanceWeightedKNN::Predict(const Eigen::MatrixXd &train_X,
                                                                  const Eigen::MatrixXd &test_X,
                                                                  const std::vector<std::string> &train_labels,
                                                                  const core::KnnOptions &options) {
	options.Validate(static_cast<size_t>(train_X.rows()));
	ValidateShapes(train_X, test_X, train_labels.size());

	NUMFIT_DEBUG("KNN classification: n_train=" << train_X.rows() << " n_test=" << test_X.rows()
	                                            << " features=" << train_X.cols() << " k=" << options.k
	                                            << " weighted=" << (options.weighted ? "true" : "false"));
	NUMFIT_TIMING_START();

	const Eigen::MatrixXd distances = ComputeDistanceMatrix(train_X, test_X);

	core::KnnClassificationResult result;
	result.k = options.k;
	result.weighted = options.weighted;
	result.predictions.reserve(static_cast<size_t>(test_X.rows()));
	result.neighborhoods.reserve(static_cast<size_t>(test_X.rows()));

	for (Eigen::Index j = 0; j < test_X.rows(); j++) {
		core::Neighborhood neighborhood = SelectNeighborhood(distances, j, options);
		result.predictions.push_back(VoteLabel(neighborhood, train_labels));
		NUMFIT_TRACE("test row " << j << ": nearest train row " << neighborhood.indices.front() << " at distance "
		                          << neighborhood.distances.front() << ", label " << result.predictions.back());
		result.neighborhoods.push_back(std::move(neighborhood));
	}

	NUMFIT_TIMING_END("KNN classification");
	return result;
}

inline core::KnnClassificationResult DistanceWeightedKNN::Predict(const Eigen::MatrixXd &train_X,
                                                                  const Eigen::MatrixXd &test_X,
                                                                  const std::vector<std::string> &train_labels,
                                                                  const core::KnnOptions &options,
                                                                  const std::vector<std::string> &test_labels) {
	if (test_labels.size() != static_cast<size_t>(test_X.rows())) {
		throw core::DimensionMismatchError::Lengths("Test labels must match test rows",
		                                            static_cast<size_t>(test_X.rows()), test_labels.size());
	}
	core::KnnClassificationResult result = Predict(train_X, test_X, train_labels, options);
	ScoreClassification(result, test_labels);
	return result;
}

inline void DistanceWeightedKNN::ScoreRegression(core::KnnRegressionResult &result, const Eigen::VectorXd &test_y) {
	if (test_y.size() == 0) {
		return;
	}
	result.residuals = test_y - result.predictions;
	result.sse = result.residuals.squaredNorm();
	result.mse = result.sse / static_cast<double>(test_y.size());
	result.rmse = std::sqrt(result.mse);
	result.has_metrics = true;
}

inline void DistanceWeightedKNN::ScoreClassification(core::KnnClassificationResult &result,
                                                     const std::vector<std::string> &test_labels) {
	if (test_labels.empty()) {
		return;
	}

	std::set<std::string> label_set(test_labels.begin(), test_labels.end());
	label_set.insert(result.predictions.begin(), result.predictions.end());
	result.confusion_labels.assign(label_set.begin(), label_set.end());

	auto position = [&result](const std::string &label) {
		for (size_t i = 0; i < result.confusion_labels.size(); i++) {
			if (result.confusion_labels[i] == label) {
				return static_cast<Eigen::Index>(i);
			}
		}
		return static_cast<Eigen::Index>(-1);
	};

	const auto n_labels = static_cast<Eigen::Index>(result.confusion_labels.size());
	result.confusion_matrix = Eigen::MatrixXi::Zero(n_labels, n_labels);

	size_t correct = 0;
	for (size_t i = 0; i < test_labels.size(); i++) {
		if (result.predictions[i] == test_labels[i]) {
			correct++;
		}
		result.confusion_matrix(position(result.predictions[i]), position(test_labels[i])) += 1;
	}

	result.accuracy = static_cast<double>(correct) / static_cast<double>(test_labels.size());
	result.error_rate = 1.0 - result.accuracy;
	result.has_metrics = true;
}

} // namespace neighbors
} // namespace libnumfit
