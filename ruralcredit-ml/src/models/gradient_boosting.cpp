#include "ruralcredit-ml/models/gradient_boosting.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>

namespace ruralcreditml::models {

// --- Model Implementation ---

GradientBoostedTrees::GradientBoostedTrees(GradientBoostingConfig config)
    : config_(config), base_(config.ridge_lambda) {
	if (config_.n_estimators <= 0) {
		throw std::invalid_argument("Number of estimators must be positive.");
	}
	if (config_.max_depth <= 0) {
		throw std::invalid_argument("Maximum depth must be positive.");
	}
	if (config_.learning_rate <= 0.0) {
		throw std::invalid_argument("Learning rate must be positive.");
	}
	if (config_.subsample <= 0.0 || config_.subsample > 1.0) {
		throw std::invalid_argument("Subsample ratio must lie in (0, 1].");
	}
}

void GradientBoostedTrees::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
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

	std::vector<double> prediction(n, base_score_);
	std::vector<double> grad(n);
	std::vector<double> hess(n, 1.0);
	std::vector<std::size_t> all_rows(n);
	std::iota(all_rows.begin(), all_rows.end(), std::size_t{0});

	std::mt19937 rng(config_.seed);
	const auto sample_size =
	    std::max<std::size_t>(1, static_cast<std::size_t>(config_.subsample * static_cast<double>(n)));

	TreeGrowthParams params;
	params.max_depth = config_.max_depth;
	params.lambda = config_.lambda;
	params.gamma = config_.gamma;
	params.min_child_weight = config_.min_child_weight;

	trees_.reserve(static_cast<std::size_t>(config_.n_estimators));
	for (int round = 0; round < config_.n_estimators; ++round) {
		for (std::size_t i = 0; i < n; ++i) {
			grad[i] = prediction[i] - residual(static_cast<Eigen::Index>(i));
		}

		std::vector<std::size_t> rows = all_rows;
		if (sample_size < n) {
			std::shuffle(rows.begin(), rows.end(), rng);
			rows.resize(sample_size);
			std::sort(rows.begin(), rows.end());
		}

		RegressionTree tree = growExactTree(X, grad, hess, rows, params);
		tree.scaleLeaves(config_.learning_rate);
		for (std::size_t i = 0; i < n; ++i) {
			prediction[i] += tree.predictRow(X, static_cast<Eigen::Index>(i));
		}
		trees_.push_back(std::move(tree));
	}

	is_fitted_ = true;
	RURALCREDIT_DEBUG("Gradient boosting fitted {} trees on {} rows x {} features.", trees_.size(), n, n_features_);
}

Eigen::VectorXd GradientBoostedTrees::predict(const Eigen::MatrixXd &X) const {
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

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withEstimators(int n_estimators) {
	config_.n_estimators = n_estimators;
	return *this;
}

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withMaxDepth(int max_depth) {
	config_.max_depth = max_depth;
	return *this;
}

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withLearningRate(double learning_rate) {
	config_.learning_rate = learning_rate;
	return *this;
}

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withLambda(double lambda) {
	config_.lambda = lambda;
	return *this;
}

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withSubsample(double subsample) {
	config_.subsample = subsample;
	return *this;
}

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withSeed(std::uint32_t seed) {
	config_.seed = seed;
	return *this;
}

GradientBoostedTreesBuilder &GradientBoostedTreesBuilder::withLinearBase(bool enabled) {
	config_.linear_base = enabled;
	return *this;
}

std::unique_ptr<GradientBoostedTrees> GradientBoostedTreesBuilder::build() {
	RURALCREDIT_DEBUG("Building gradient boosting with {} trees, depth {}, learning rate {}.", config_.n_estimators,
	                  config_.max_depth, config_.learning_rate);
	return std::unique_ptr<GradientBoostedTrees>(new GradientBoostedTrees(config_));
}

} // namespace ruralcreditml::models
