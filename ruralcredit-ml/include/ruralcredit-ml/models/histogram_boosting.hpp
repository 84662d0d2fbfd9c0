#pragma once

#include "ruralcredit-ml/models/iregressor.hpp"
#include "ruralcredit-ml/models/regression_tree.hpp"
#include "ruralcredit-ml/models/ridge_base.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace ruralcreditml::models {

class HistogramBoostedTreesBuilder; // Forward declaration

/**
 * @struct HistogramBoostingConfig
 * @brief Settings of the histogram-based, leaf-wise boosted tree ensemble.
 */
struct HistogramBoostingConfig {
	int n_estimators = 100;
	int max_depth = 4;
	int num_leaves = 31;
	double learning_rate = 0.1;
	int max_bin = 255;
	std::size_t min_data_in_leaf = 20;
	double min_sum_hessian_in_leaf = 1e-3;
	double lambda_l2 = 0.0;
	double bagging_fraction = 1.0;
	std::uint32_t seed = 42;
	bool linear_base = true;
	double ridge_lambda = 1.0;
};

/**
 * @class FeatureBinner
 * @brief Maps raw feature values to at most max_bin ordered bins per column.
 *
 * Bin b holds values in (upper[b-1], upper[b]]; the last bin is open-ended.
 */
class FeatureBinner {
public:
	void fit(const Eigen::MatrixXd &X, int max_bin);

	int binOf(Eigen::Index feature, double value) const;

	/// Number of bins of a feature.
	int binCount(Eigen::Index feature) const;

	/// Raw threshold equivalent to "bin <= b".
	double upperBound(Eigen::Index feature, int bin) const;

private:
	std::vector<std::vector<double>> upper_bounds_;
};

/**
 * @class HistogramBoostedTrees
 * @brief Gradient boosting over binned features with leaf-wise growth (the "lightgbm" kind).
 *
 * Each round repeatedly splits the leaf with the largest gain until the leaf budget,
 * depth limit or minimum leaf size stops it.
 */
class HistogramBoostedTrees final : public IRegressor {
public:
	friend class HistogramBoostedTreesBuilder;

	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override;
	std::string getName() const override {
		return "lightgbm";
	}

	const std::vector<RegressionTree> &trees() const {
		return trees_;
	}

	const HistogramBoostingConfig &config() const {
		return config_;
	}

private:
	explicit HistogramBoostedTrees(HistogramBoostingConfig config);

	RegressionTree growLeafWise(const std::vector<std::vector<int>> &bins, const std::vector<double> &grad,
	                            const std::vector<double> &hess, const std::vector<std::size_t> &rows) const;

	HistogramBoostingConfig config_;
	RidgeBase base_;
	FeatureBinner binner_;
	double base_score_ = 0.0;
	std::vector<RegressionTree> trees_;
	Eigen::Index n_features_ = 0;
	bool is_fitted_ = false;
};

/**
 * @class HistogramBoostedTreesBuilder
 * @brief A builder for fluently configuring and creating HistogramBoostedTrees models.
 */
class HistogramBoostedTreesBuilder {
public:
	HistogramBoostedTreesBuilder &withEstimators(int n_estimators);
	HistogramBoostedTreesBuilder &withMaxDepth(int max_depth);
	HistogramBoostedTreesBuilder &withNumLeaves(int num_leaves);
	HistogramBoostedTreesBuilder &withLearningRate(double learning_rate);
	HistogramBoostedTreesBuilder &withMinDataInLeaf(std::size_t min_data_in_leaf);
	HistogramBoostedTreesBuilder &withMaxBin(int max_bin);
	HistogramBoostedTreesBuilder &withSeed(std::uint32_t seed);
	HistogramBoostedTreesBuilder &withLinearBase(bool enabled);

	std::unique_ptr<HistogramBoostedTrees> build();

private:
	HistogramBoostingConfig config_;
};

} // namespace ruralcreditml::models
