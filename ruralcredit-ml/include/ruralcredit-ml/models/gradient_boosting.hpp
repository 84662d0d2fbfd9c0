#pragma once

#include "ruralcredit-ml/models/iregressor.hpp"
#include "ruralcredit-ml/models/regression_tree.hpp"
#include "ruralcredit-ml/models/ridge_base.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace ruralcreditml::models {

class GradientBoostedTreesBuilder; // Forward declaration

/**
 * @struct GradientBoostingConfig
 * @brief Settings of the second-order boosted tree ensemble.
 */
struct GradientBoostingConfig {
	int n_estimators = 100;
	int max_depth = 4;
	double learning_rate = 0.1;
	double lambda = 1.0;           // L2 penalty on leaf weights
	double gamma = 0.0;            // Minimum loss reduction per split
	double min_child_weight = 1.0;
	double subsample = 1.0;        // Row fraction per tree, drawn without replacement
	std::uint32_t seed = 42;
	bool linear_base = true;
	double ridge_lambda = 1.0;
};

/**
 * @class GradientBoostedTrees
 * @brief Gradient boosting with exact greedy, depth-wise regression trees (the "xgboost" kind).
 *
 * Squared-error loss: every round fits a tree to gradient = prediction - target with unit
 * hessians, leaf weights -G/(H + lambda), shrunk by the learning rate. Boosting starts
 * from the ridge base prediction plus the mean residual.
 */
class GradientBoostedTrees final : public IRegressor {
public:
	friend class GradientBoostedTreesBuilder;

	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override;
	std::string getName() const override {
		return "xgboost";
	}

	const std::vector<RegressionTree> &trees() const {
		return trees_;
	}

	const GradientBoostingConfig &config() const {
		return config_;
	}

private:
	explicit GradientBoostedTrees(GradientBoostingConfig config);

	GradientBoostingConfig config_;
	RidgeBase base_;
	double base_score_ = 0.0;
	std::vector<RegressionTree> trees_;
	Eigen::Index n_features_ = 0;
	bool is_fitted_ = false;
};

/**
 * @class GradientBoostedTreesBuilder
 * @brief A builder for fluently configuring and creating GradientBoostedTrees models.
 */
class GradientBoostedTreesBuilder {
public:
	GradientBoostedTreesBuilder &withEstimators(int n_estimators);
	GradientBoostedTreesBuilder &withMaxDepth(int max_depth);
	GradientBoostedTreesBuilder &withLearningRate(double learning_rate);
	GradientBoostedTreesBuilder &withLambda(double lambda);
	GradientBoostedTreesBuilder &withSubsample(double subsample);
	GradientBoostedTreesBuilder &withSeed(std::uint32_t seed);
	GradientBoostedTreesBuilder &withLinearBase(bool enabled);

	/**
	 * @brief Creates a new model instance.
	 * @throws std::invalid_argument for out-of-range settings.
	 */
	std::unique_ptr<GradientBoostedTrees> build();

private:
	GradientBoostingConfig config_;
};

} // namespace ruralcreditml::models
