#include "ruralcredit-ml/models/histogram_boosting.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>

namespace ruralcreditml::models {

namespace {

constexpr double kMinSplitGain = 1e-12;

struct LeafSplit {
	int feature = -1;
	int bin = -1;
	double gain = 0.0;
};

struct LeafState {
	int node = 0;
	std::vector<std::size_t> rows;
	double grad_sum = 0.0;
	double hess_sum = 0.0;
	int depth = 0;
	LeafSplit best;
};

double leaf_output(double grad_sum, double hess_sum, double lambda) {
	const double denom = hess_sum + lambda;
	return denom > 0.0 ? -grad_sum / denom : 0.0;
}

double leaf_score(double grad_sum, double hess_sum, double lambda) {
	const double denom = hess_sum + lambda;
	return denom > 0.0 ? grad_sum * grad_sum / denom : 0.0;
}

} // namespace

// --- Feature binning ---

void FeatureBinner::fit(const Eigen::MatrixXd &X, int max_bin) {
	if (max_bin < 2) {
		throw std::invalid_argument("At least two bins per feature are required.");
	}
	upper_bounds_.assign(static_cast<std::size_t>(X.cols()), {});
	const auto n = static_cast<std::size_t>(X.rows());
	for (Eigen::Index f = 0; f < X.cols(); ++f) {
		std::vector<double> sorted(n);
		for (std::size_t i = 0; i < n; ++i) {
			sorted[i] = X(static_cast<Eigen::Index>(i), f);
		}
		std::sort(sorted.begin(), sorted.end());

		std::vector<double> distinct = sorted;
		distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

		auto &bounds = upper_bounds_[static_cast<std::size_t>(f)];
		if (distinct.size() <= static_cast<std::size_t>(max_bin)) {
			for (std::size_t i = 0; i + 1 < distinct.size(); ++i) {
				bounds.push_back(0.5 * (distinct[i] + distinct[i + 1]));
			}
		} else {
			// Quantile cuts over the sorted sample
			for (int k = 1; k < max_bin; ++k) {
				const std::size_t idx = static_cast<std::size_t>(k) * n / static_cast<std::size_t>(max_bin);
				if (idx == 0 || idx >= n || !(sorted[idx - 1] < sorted[idx])) {
					continue;
				}
				const double cut = 0.5 * (sorted[idx - 1] + sorted[idx]);
				if (bounds.empty() || bounds.back() < cut) {
					bounds.push_back(cut);
				}
			}
		}
		bounds.push_back(std::numeric_limits<double>::infinity());
	}
}

int FeatureBinner::binOf(Eigen::Index feature, double value) const {
	const auto &bounds = upper_bounds_.at(static_cast<std::size_t>(feature));
	const auto it = std::lower_bound(bounds.begin(), bounds.end(), value);
	if (it == bounds.end()) {
		return static_cast<int>(bounds.size()) - 1;
	}
	return static_cast<int>(std::distance(bounds.begin(), it));
}

int FeatureBinner::binCount(Eigen::Index feature) const {
	return static_cast<int>(upper_bounds_.at(static_cast<std::size_t>(feature)).size());
}

double FeatureBinner::upperBound(Eigen::Index feature, int bin) const {
	return upper_bounds_.at(static_cast<std::size_t>(feature)).at(static_cast<std::size_t>(bin));
}

// --- Model Implementation ---

HistogramBoostedTrees::HistogramBoostedTrees(HistogramBoostingConfig config)
    : config_(config), base_(config.ridge_lambda) {
	if (config_.n_estimators <= 0) {
		throw std::invalid_argument("Number of estimators must be positive.");
	}
	if (config_.max_depth <= 0) {
		throw std::invalid_argument("Maximum depth must be positive.");
	}
	if (config_.num_leaves < 2) {
		throw std::invalid_argument("Leaf budget must be at least two.");
	}
	if (config_.learning_rate <= 0.0) {
		throw std::invalid_argument("Learning rate must be positive.");
	}
	if (config_.min_data_in_leaf == 0) {
		throw std::invalid_argument("Minimum rows per leaf must be positive.");
	}
	if (config_.bagging_fraction <= 0.0 || config_.bagging_fraction > 1.0) {
		throw std::invalid_argument("Bagging fraction must lie in (0, 1].");
	}
}

RegressionTree HistogramBoostedTrees::growLeafWise(const std::vector<std::vector<int>> &bins,
                                                   const std::vector<double> &grad, const std::vector<double> &hess,
                                                   const std::vector<std::size_t> &rows) const {
	const double lambda = config_.lambda_l2;

	auto find_split = [&](LeafState &leaf) {
		leaf.best = LeafSplit{};
		if (leaf.depth >= config_.max_depth || leaf.rows.size() < 2 * config_.min_data_in_leaf) {
			return;
		}
		const double parent = leaf_score(leaf.grad_sum, leaf.hess_sum, lambda);
		for (Eigen::Index f = 0; f < n_features_; ++f) {
			const int n_bins = binner_.binCount(f);
			std::vector<double> grad_hist(static_cast<std::size_t>(n_bins), 0.0);
			std::vector<double> hess_hist(static_cast<std::size_t>(n_bins), 0.0);
			std::vector<std::size_t> count_hist(static_cast<std::size_t>(n_bins), 0);
			const auto &column = bins[static_cast<std::size_t>(f)];
			for (std::size_t r : leaf.rows) {
				const auto b = static_cast<std::size_t>(column[r]);
				grad_hist[b] += grad[r];
				hess_hist[b] += hess[r];
				++count_hist[b];
			}

			double grad_left = 0.0;
			double hess_left = 0.0;
			std::size_t count_left = 0;
			for (int b = 0; b + 1 < n_bins; ++b) {
				grad_left += grad_hist[static_cast<std::size_t>(b)];
				hess_left += hess_hist[static_cast<std::size_t>(b)];
				count_left += count_hist[static_cast<std::size_t>(b)];
				const std::size_t count_right = leaf.rows.size() - count_left;
				if (count_left < config_.min_data_in_leaf || count_right < config_.min_data_in_leaf) {
					continue;
				}
				const double hess_right = leaf.hess_sum - hess_left;
				if (hess_left < config_.min_sum_hessian_in_leaf || hess_right < config_.min_sum_hessian_in_leaf) {
					continue;
				}
				const double gain = leaf_score(grad_left, hess_left, lambda) +
				                    leaf_score(leaf.grad_sum - grad_left, hess_right, lambda) - parent;
				if (gain > leaf.best.gain + kMinSplitGain) {
					leaf.best = LeafSplit{static_cast<int>(f), b, gain};
				}
			}
		}
	};

	RegressionTree tree;
	std::vector<LeafState> leaves(1);
	leaves[0].rows = rows;
	for (std::size_t r : rows) {
		leaves[0].grad_sum += grad[r];
		leaves[0].hess_sum += hess[r];
	}
	tree.setLeafValue(0, leaf_output(leaves[0].grad_sum, leaves[0].hess_sum, lambda));
	find_split(leaves[0]);

	while (leaves.size() < static_cast<std::size_t>(config_.num_leaves)) {
		auto best_it = std::max_element(leaves.begin(), leaves.end(), [](const LeafState &a, const LeafState &b) {
			return a.best.gain < b.best.gain;
		});
		if (best_it->best.feature < 0) {
			break;
		}
		LeafState parent = std::move(*best_it);
		leaves.erase(best_it);

		const auto feature = static_cast<std::size_t>(parent.best.feature);
		LeafState left;
		LeafState right;
		for (std::size_t r : parent.rows) {
			auto &side = bins[feature][r] <= parent.best.bin ? left : right;
			side.rows.push_back(r);
			side.grad_sum += grad[r];
			side.hess_sum += hess[r];
		}
		left.depth = parent.depth + 1;
		right.depth = parent.depth + 1;

		const auto children =
		    tree.split(parent.node, parent.best.feature, binner_.upperBound(parent.best.feature, parent.best.bin),
		               leaf_output(left.grad_sum, left.hess_sum, lambda),
		               leaf_output(right.grad_sum, right.hess_sum, lambda));
		left.node = children.first;
		right.node = children.second;
		find_split(left);
		find_split(right);
		leaves.push_back(std::move(left));
		leaves.push_back(std::move(right));
	}
	return tree;
}

void HistogramBoostedTrees::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() == 0 || X.rows() != y.size()) {
		throw std::invalid_argument("Training data must be non-empty and aligned with the targets.");
	}
	const auto n = static_cast<std::size_t>(X.rows());
	n_features_ = X.cols();
	trees_.clear();

	Eigen::VectorXd residual = y;
	if (config_.linear_base) {
		base_.fit(X, y);
		residual = y - base_.predict(X);
	}
	base_score_ = residual.mean();

	binner_.fit(X, config_.max_bin);
	std::vector<std::vector<int>> bins(static_cast<std::size_t>(n_features_), std::vector<int>(n));
	for (Eigen::Index f = 0; f < n_features_; ++f) {
		for (std::size_t i = 0; i < n; ++i) {
			bins[static_cast<std::size_t>(f)][i] = binner_.binOf(f, X(static_cast<Eigen::Index>(i), f));
		}
	}

	std::vector<double> prediction(n, base_score_);
	std::vector<double> grad(n);
	std::vector<double> hess(n, 1.0);
	std::vector<std::size_t> all_rows(n);
	std::iota(all_rows.begin(), all_rows.end(), std::size_t{0});

	std::mt19937 rng(config_.seed);
	const auto bag_size =
	    std::max<std::size_t>(1, static_cast<std::size_t>(config_.bagging_fraction * static_cast<double>(n)));

	trees_.reserve(static_cast<std::size_t>(config_.n_estimators));
	for (int round = 0; round < config_.n_estimators; ++round) {
		for (std::size_t i = 0; i < n; ++i) {
			grad[i] = prediction[i] - residual(static_cast<Eigen::Index>(i));
		}
		std::vector<std::size_t> rows = all_rows;
		if (bag_size < n) {
			std::shuffle(rows.begin(), rows.end(), rng);
			rows.resize(bag_size);
			std::sort(rows.begin(), rows.end());
		}

		RegressionTree tree = growLeafWise(bins, grad, hess, rows);
		tree.scaleLeaves(config_.learning_rate);
		for (std::size_t i = 0; i < n; ++i) {
			prediction[i] += tree.predictRow(X, static_cast<Eigen::Index>(i));
		}
		trees_.push_back(std::move(tree));
	}

	is_fitted_ = true;
	RURALCREDIT_DEBUG("Histogram boosting fitted {} trees on {} rows x {} features.", trees_.size(), n, n_features_);
}

Eigen::VectorXd HistogramBoostedTrees::predict(const Eigen::MatrixXd &X) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (X.cols() != n_features_) {
		throw std::invalid_argument("Feature count does not match the fitted model.");
	}
	Eigen::VectorXd out = config_.linear_base ? base_.predict(X) : Eigen::VectorXd::Zero(X.rows());
	out.array() += base_score_;
	for (const auto &tree : trees_) {
		for (Eigen::Index i = 0; i < X.rows(); ++i) {
			out(i) += tree.predictRow(X, i);
		}
	}
	return out;
}

// --- Builder Implementation ---

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withEstimators(int n_estimators) {
	config_.n_estimators = n_estimators;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withMaxDepth(int max_depth) {
	config_.max_depth = max_depth;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withNumLeaves(int num_leaves) {
	config_.num_leaves = num_leaves;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withLearningRate(double learning_rate) {
	config_.learning_rate = learning_rate;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withMinDataInLeaf(std::size_t min_data_in_leaf) {
	config_.min_data_in_leaf = min_data_in_leaf;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withMaxBin(int max_bin) {
	config_.max_bin = max_bin;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withSeed(std::uint32_t seed) {
	config_.seed = seed;
	return *this;
}

HistogramBoostedTreesBuilder &HistogramBoostedTreesBuilder::withLinearBase(bool enabled) {
	config_.linear_base = enabled;
	return *this;
}

std::unique_ptr<HistogramBoostedTrees> HistogramBoostedTreesBuilder::build() {
	RURALCREDIT_DEBUG("Building histogram boosting with {} trees, {} leaves, depth {}.", config_.n_estimators,
	                  config_.num_leaves, config_.max_depth);
	return std::unique_ptr<HistogramBoostedTrees>(new HistogramBoostedTrees(config_));
}

} // namespace ruralcreditml::models
