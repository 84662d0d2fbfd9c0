#include "ruralcredit-ml/models/random_forest.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <numeric>
#include <random>
#include <stdexcept>

namespace ruralcreditml::models {

RandomForest::RandomForest(RandomForestConfig config) : config_(config), base_(config.ridge_lambda) {
	if (config_.n_estimators <= 0) {
		throw std::invalid_argument("Number of estimators must be positive.");
	}
	if (config_.max_depth <= 0) {
		throw std::invalid_argument("Maximum depth must be positive.");
	}
}

void RandomForest::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
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

	// CART as a special case of gradient growth: grad = -y, hess = 1, no penalty
	std::vector<double> grad(n);
	for (std::size_t i = 0; i < n; ++i) {
		grad[i] = -residual(static_cast<Eigen::Index>(i));
	}
	const std::vector<double> hess(n, 1.0);

	TreeGrowthParams params;
	params.max_depth = config_.max_depth;
	params.lambda = 0.0;
	params.gamma = 0.0;
	params.min_child_weight = 1.0;
	params.half_gain = false;

	std::mt19937 rng(config_.seed);
	std::uniform_int_distribution<std::size_t> draw(0, n - 1);
	std::vector<std::size_t> rows(n);

	trees_.reserve(static_cast<std::size_t>(config_.n_estimators));
	for (int t = 0; t < config_.n_estimators; ++t) {
		if (config_.bootstrap) {
			for (auto &row : rows) {
				row = draw(rng);
			}
		} else {
			std::iota(rows.begin(), rows.end(), std::size_t{0});
		}
		trees_.push_back(growExactTree(X, grad, hess, rows, params));
	}

	is_fitted_ = true;
	RURALCREDIT_DEBUG("Random forest fitted {} trees on {} rows x {} features.", trees_.size(), n, n_features_);
}

Eigen::VectorXd RandomForest::predict(const Eigen::MatrixXd &X) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (X.cols() != n_features_) {
		throw std::invalid_argument("Feature count does not match the fitted model.");
	}
	Eigen::VectorXd average = Eigen::VectorXd::Zero(X.rows());
	for (const auto &tree : trees_) {
		for (Eigen::Index i = 0; i < X.rows(); ++i) {
			average(i) += tree.predictRow(X, i);
		}
	}
	average /= static_cast<double>(trees_.size());
	if (config_.linear_base) {
		average += base_.predict(X);
	}
	return average;
}

RandomForestBuilder &RandomForestBuilder::withEstimators(int n_estimators) {
	config_.n_estimators = n_estimators;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withMaxDepth(int max_depth) {
	config_.max_depth = max_depth;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withBootstrap(bool bootstrap) {
	config_.bootstrap = bootstrap;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withSeed(std::uint32_t seed) {
	config_.seed = seed;
	return *this;
}

RandomForestBuilder &RandomForestBuilder::withLinearBase(bool enabled) {
	config_.linear_base = enabled;
	return *this;
}

std::unique_ptr<RandomForest> RandomForestBuilder::build() {
	RURALCREDIT_DEBUG("Building random forest with {} trees, depth {}.", config_.n_estimators, config_.max_depth);
	return std::unique_ptr<RandomForest>(new RandomForest(config_));
}

} // namespace ruralcreditml::models
