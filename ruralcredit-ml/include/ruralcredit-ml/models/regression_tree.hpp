#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <utility>
#include <vector>

namespace ruralcreditml::models {

/**
 * @struct TreeNode
 * @brief A split or a leaf of a binary regression tree.
 */
struct TreeNode {
	int feature = -1;        ///< Split feature, -1 for a leaf
	double threshold = 0.0;  ///< Rows with x[feature] <= threshold go left
	int left = -1;
	int right = -1;
	double value = 0.0;      ///< Leaf output
	int depth = 0;

	bool isLeaf() const {
		return feature < 0;
	}
};

/**
 * @class RegressionTree
 * @brief Flat array representation of a binary regression tree.
 */
class RegressionTree {
public:
	RegressionTree();

	/// Turns leaf @p node into a split and returns the indices of its new children.
	std::pair<int, int> split(int node, int feature, double threshold, double left_value, double right_value);

	void setLeafValue(int node, double value);

	/// Multiplies every leaf output by @p factor (shrinkage).
	void scaleLeaves(double factor);

	double predictRow(const Eigen::MatrixXd &X, Eigen::Index row) const;

	const std::vector<TreeNode> &nodes() const {
		return nodes_;
	}

	std::size_t leafCount() const;
	int depth() const;

private:
	std::vector<TreeNode> nodes_;
};

/**
 * @struct TreeGrowthParams
 * @brief Stopping and regularisation rules for exact greedy tree growth.
 */
struct TreeGrowthParams {
	int max_depth = 6;
	double lambda = 0.0;           ///< L2 penalty on leaf weights
	double gamma = 0.0;            ///< Minimum loss reduction to split
	double min_child_weight = 1.0; ///< Minimum hessian sum in each child
	bool half_gain = true;         ///< Report gain as 0.5 * (...) as second-order boosting does
};

/**
 * @brief Grows a tree depth-wise with exact greedy split search on gradient statistics.
 *
 * Leaf weights are -G / (H + lambda). With grad = -y, hess = 1 and lambda = 0 this is
 * a CART regression tree with variance-reduction splits and mean leaves.
 *
 * @param X Feature matrix.
 * @param grad First-order gradients, one per row of @p X.
 * @param hess Second-order gradients, one per row of @p X.
 * @param samples Row indices used for growth; repeats act as weights (bootstrap).
 */
RegressionTree growExactTree(const Eigen::MatrixXd &X, const std::vector<double> &grad,
                             const std::vector<double> &hess, const std::vector<std::size_t> &samples,
                             const TreeGrowthParams &params);

} // namespace ruralcreditml::models
