#pragma once

#include "ruralcredit-ml/models/iregressor.hpp"
#include "ruralcredit-ml/models/regression_tree.hpp"
#include "ruralcredit-ml/models/ridge_base.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace ruralcreditml::models {

class RandomForestBuilder; // Forward declaration

struct RandomForestConfig {
	int n_estimators = 100;
	int max_depth = 6;
	bool bootstrap = true;
	std::uint32_t seed = 42;
	bool linear_base = true;
	double ridge_lambda = 1.0;
};

/**
 * @class RandomForest
 * @brief Bagged CART regression trees averaged at prediction time (the "randomforest" kind).
 *
 * Every split considers all features; randomness comes only from the bootstrap draws of
 * a generator seeded once per fit, so refitting the same data gives the same forest.
 */
class RandomForest final : public IRegressor {
public:
	friend class RandomForestBuilder;

	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) override;
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override;
	std::string getName() const override {
		return "randomforest";
	}

	const std::vector<RegressionTree> &trees() const {
		return trees_;
	}

private:
	explicit RandomForest(RandomForestConfig config);

	RandomForestConfig config_;
	RidgeBase base_;
	std::vector<RegressionTree> trees_;
	Eigen::Index n_features_ = 0;
	bool is_fitted_ = false;
};

class RandomForestBuilder {
public:
	RandomForestBuilder &withEstimators(int n_estimators);
	RandomForestBuilder &withMaxDepth(int max_depth);
	RandomForestBuilder &withBootstrap(bool bootstrap);
	RandomForestBuilder &withSeed(std::uint32_t seed);
	RandomForestBuilder &withLinearBase(bool enabled);

	std::unique_ptr<RandomForest> build();

private:
	RandomForestConfig config_;
};

} // namespace ruralcreditml::models
