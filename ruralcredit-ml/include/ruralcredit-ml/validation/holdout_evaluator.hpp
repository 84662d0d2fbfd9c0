#pragma once

#include "ruralcredit-ml/core/pipeline_config.hpp"
#include "ruralcredit-ml/features/feature_frame.hpp"
#include "ruralcredit-ml/models/iregressor.hpp"
#include "ruralcredit-ml/utils/metrics.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace ruralcreditml::validation {

/**
 * @struct HoldoutSplit
 * @brief Leading training block and trailing test block of a feature frame.
 *
 * Rows keep their temporal order; the test block is always the most recent slice.
 */
struct HoldoutSplit {
	std::size_t train_rows = 0;
	std::size_t test_rows = 0;
	Eigen::MatrixXd X_train;
	Eigen::VectorXd y_train;
	Eigen::MatrixXd X_test;
	Eigen::VectorXd y_test;
};

struct HoldoutEvaluation {
	HoldoutSplit split;
	std::vector<double> test_predictions;
	utils::AccuracyMetrics metrics;
};

/**
 * @class HoldoutEvaluator
 * @brief Trailing-block hold-out evaluation for one model on one series.
 */
class HoldoutEvaluator {
public:
	explicit HoldoutEvaluator(core::PipelineConfig config);

	/// Test block size: min(test_size, floor(rows / 4)).
	std::size_t testSize(std::size_t rows) const;

	/**
	 * @brief Splits a frame into train/test blocks without shuffling.
	 * @throws core::InsufficientDataError if the test block is empty or the training
	 *         block is smaller than the configured minimum.
	 */
	HoldoutSplit split(const features::FeatureFrame &frame) const;

	/**
	 * @brief Fits @p model on the training block and scores it on the test block.
	 */
	HoldoutEvaluation evaluate(models::IRegressor &model, const features::FeatureFrame &frame) const;

private:
	core::PipelineConfig config_;
};

} // namespace ruralcreditml::validation
