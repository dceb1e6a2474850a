#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace libnumfit {
namespace core {

/**
 * Neighborhood of one test point
 *
 * Indices into the training set, nearest first, with their distances and the
 * weights used for voting/averaging (all 1 when unweighted).
 */
struct Neighborhood {
	std::vector<size_t> indices;
	std::vector<double> distances;
	std::vector<double> weights;
};

/**
 * Result of a k-NN regression
 *
 * Metric fields are only meaningful when has_metrics is true, i.e. when the
 * true test responses were supplied.
 */
struct KnnRegressionResult {
	/// Predicted response per test point (length = n_test)
	Eigen::VectorXd predictions;

	/// Neighborhood of every test point (length = n_test)
	std::vector<Neighborhood> neighborhoods;

	size_t k = 0;

	bool weighted = false;

	// ========================================================================
	// Optional: metrics against true test responses
	// ========================================================================

	/// y_true - prediction (length = n_test)
	Eigen::VectorXd residuals;

	double sse = std::numeric_limits<double>::quiet_NaN();

	double mse = std::numeric_limits<double>::quiet_NaN();

	double rmse = std::numeric_limits<double>::quiet_NaN();

	bool has_metrics = false;

	KnnRegressionResult() = default;
};

/**
 * Result of a k-NN classification
 *
 * The confusion matrix cross-tabulates predicted labels (rows) against true
 * labels (columns); both axes follow confusion_labels, the sorted union of
 * predicted and true labels.
 */
struct KnnClassificationResult {
	/// Predicted label per test point (length = n_test)
	std::vector<std::string> predictions;

	/// Neighborhood of every test point (length = n_test)
	std::vector<Neighborhood> neighborhoods;

	size_t k = 0;

	bool weighted = false;

	// ========================================================================
	// Optional: metrics against true test labels
	// ========================================================================

	/// mean(prediction == truth)
	double accuracy = std::numeric_limits<double>::quiet_NaN();

	/// 1 - accuracy
	double error_rate = std::numeric_limits<double>::quiet_NaN();

	/// Axis labels of the confusion matrix, sorted
	std::vector<std::string> confusion_labels;

	/// confusion_matrix(i, j) = count of (predicted = labels[i], truth = labels[j])
	Eigen::MatrixXi confusion_matrix;

	bool has_metrics = false;

	KnnClassificationResult() = default;

	/// Count for a (predicted, truth) pair; 0 if either label is absent
	int ConfusionCount(const std::string &predicted, const std::string &truth) const {
		Eigen::Index row = -1;
		Eigen::Index col = -1;
		for (size_t i = 0; i < confusion_labels.size(); i++) {
			if (confusion_labels[i] == predicted) {
				row = static_cast<Eigen::Index>(i);
			}
			if (confusion_labels[i] == truth) {
				col = static_cast<Eigen::Index>(i);
			}
		}
		if (row < 0 || col < 0) {
			return 0;
		}
		return confusion_matrix(row, col);
	}
};

} // namespace core
} // namespace libnumfit
