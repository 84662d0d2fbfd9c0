#include "ruralcredit-ml/models/regression_tree.hpp"

#include <algorithm>
#include <stdexcept>

namespace ruralcreditml::models {

namespace {

constexpr double kMinSplitGain = 1e-12;

struct SplitCandidate {
	int feature = -1;
	double threshold = 0.0;
	double gain = 0.0;
};

struct PendingNode {
	int node = 0;
	std::vector<std::size_t> samples;
	double grad_sum = 0.0;
	double hess_sum = 0.0;
};

double leaf_weight(double grad_sum, double hess_sum, double lambda) {
	const double denom = hess_sum + lambda;
	if (denom <= 0.0) {
		return 0.0;
	}
	return -grad_sum / denom;
}

double structure_score(double grad_sum, double hess_sum, double lambda) {
	const double denom = hess_sum + lambda;
	if (denom <= 0.0) {
		return 0.0;
	}
	return grad_sum * grad_sum / denom;
}

SplitCandidate find_best_split(const Eigen::MatrixXd &X, const std::vector<double> &grad,
                               const std::vector<double> &hess, const PendingNode &pending,
                               const TreeGrowthParams &params) {
	SplitCandidate best;
	const double parent_score = structure_score(pending.grad_sum, pending.hess_sum, params.lambda);
	const double gain_factor = params.half_gain ? 0.5 : 1.0;

	std::vector<std::size_t> order = pending.samples;
	for (Eigen::Index f = 0; f < X.cols(); ++f) {
		std::stable_sort(order.begin(), order.end(),
		                 [&](std::size_t a, std::size_t b) { return X(static_cast<Eigen::Index>(a), f) <
		                                                            X(static_cast<Eigen::Index>(b), f); });

		double grad_left = 0.0;
		double hess_left = 0.0;
		for (std::size_t i = 0; i + 1 < order.size(); ++i) {
			grad_left += grad[order[i]];
			hess_left += hess[order[i]];

			const double current = X(static_cast<Eigen::Index>(order[i]), f);
			const double upcoming = X(static_cast<Eigen::Index>(order[i + 1]), f);
			if (!(current < upcoming)) {
				continue;
			}
			const double grad_right = pending.grad_sum - grad_left;
			const double hess_right = pending.hess_sum - hess_left;
			if (hess_left < params.min_child_weight || hess_right < params.min_child_weight) {
				continue;
			}

			const double gain = gain_factor * (structure_score(grad_left, hess_left, params.lambda) +
			                                   structure_score(grad_right, hess_right, params.lambda) -
			                                   parent_score) -
			                    params.gamma;
			if (gain > best.gain + kMinSplitGain) {
				best.feature = static_cast<int>(f);
				best.threshold = 0.5 * (current + upcoming);
				best.gain = gain;
			}
		}
	}
	return best;
}

} // namespace

RegressionTree::RegressionTree() {
	nodes_.push_back(TreeNode{});
}

std::pair<int, int> RegressionTree::split(int node, int feature, double threshold, double left_value,
                                          double right_value) {
	if (node < 0 || static_cast<std::size_t>(node) >= nodes_.size() || !nodes_[node].isLeaf()) {
		throw std::invalid_argument("Only existing leaves can be split.");
	}
	if (feature < 0) {
		throw std::invalid_argument("Split feature must be non-negative.");
	}
	const int depth = nodes_[node].depth + 1;
	TreeNode left;
	left.value = left_value;
	left.depth = depth;
	TreeNode right;
	right.value = right_value;
	right.depth = depth;

	const int left_index = static_cast<int>(nodes_.size());
	nodes_.push_back(left);
	const int right_index = static_cast<int>(nodes_.size());
	nodes_.push_back(right);

	auto &parent = nodes_[node];
	parent.feature = feature;
	parent.threshold = threshold;
	parent.left = left_index;
	parent.right = right_index;
	return {left_index, right_index};
}

void RegressionTree::setLeafValue(int node, double value) {
	if (node < 0 || static_cast<std::size_t>(node) >= nodes_.size()) {
		throw std::out_of_range("Tree node index out of range.");
	}
	nodes_[node].value = value;
}

void RegressionTree::scaleLeaves(double factor) {
	for (auto &node : nodes_) {
		if (node.isLeaf()) {
			node.value *= factor;
		}
	}
}

double RegressionTree::predictRow(const Eigen::MatrixXd &X, Eigen::Index row) const {
	int current = 0;
	while (!nodes_[current].isLeaf()) {
		const auto &node = nodes_[current];
		current = X(row, node.feature) <= node.threshold ? node.left : node.right;
	}
	return nodes_[current].value;
}

std::size_t RegressionTree::leafCount() const {
	return static_cast<std::size_t>(
	    std::count_if(nodes_.begin(), nodes_.end(), [](const TreeNode &node) { return node.isLeaf(); }));
}

int RegressionTree::depth() const {
	int max_depth = 0;
	for (const auto &node : nodes_) {
		max_depth = std::max(max_depth, node.depth);
	}
	return max_depth;
}

RegressionTree growExactTree(const Eigen::MatrixXd &X, const std::vector<double> &grad,
                             const std::vector<double> &hess, const std::vector<std::size_t> &samples,
                             const TreeGrowthParams &params) {
	if (grad.size() != static_cast<std::size_t>(X.rows()) || hess.size() != grad.size()) {
		throw std::invalid_argument("Gradient statistics must align with the feature matrix rows.");
	}
	if (samples.empty()) {
		throw std::invalid_argument("Cannot grow a tree without samples.");
	}

	RegressionTree tree;
	PendingNode root;
	root.node = 0;
	root.samples = samples;
	for (std::size_t s : samples) {
		root.grad_sum += grad[s];
		root.hess_sum += hess[s];
	}
	tree.setLeafValue(0, leaf_weight(root.grad_sum, root.hess_sum, params.lambda));

	std::vector<PendingNode> stack;
	stack.push_back(std::move(root));
	while (!stack.empty()) {
		PendingNode pending = std::move(stack.back());
		stack.pop_back();

		if (tree.nodes()[pending.node].depth >= params.max_depth || pending.samples.size() < 2) {
			continue;
		}
		const auto best = find_best_split(X, grad, hess, pending, params);
		if (best.feature < 0) {
			continue;
		}

		PendingNode left;
		PendingNode right;
		for (std::size_t s : pending.samples) {
			auto &side = X(static_cast<Eigen::Index>(s), best.feature) <= best.threshold ? left : right;
			side.samples.push_back(s);
			side.grad_sum += grad[s];
			side.hess_sum += hess[s];
		}
		const auto children = tree.split(pending.node, best.feature, best.threshold,
		                                 leaf_weight(left.grad_sum, left.hess_sum, params.lambda),
		                                 leaf_weight(right.grad_sum, right.hess_sum, params.lambda));
		left.node = children.first;
		right.node = children.second;
		stack.push_back(std::move(right));
		stack.push_back(std::move(left));
	}
	return tree;
}

} // namespace ruralcreditml::models
