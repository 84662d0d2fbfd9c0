#include "ruralcredit-ml/validation/holdout_evaluator.hpp"

#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <algorithm>

namespace ruralcreditml::validation {

HoldoutEvaluator::HoldoutEvaluator(core::PipelineConfig config) : config_(std::move(config)) {
	config_.validate();
}

std::size_t HoldoutEvaluator::testSize(std::size_t rows) const {
	return std::min(config_.test_size, rows / 4);
}

HoldoutSplit HoldoutEvaluator::split(const features::FeatureFrame &frame) const {
	const std::size_t rows = frame.size();
	const std::size_t test_rows = testSize(rows);
	if (test_rows == 0) {
		throw core::InsufficientDataError("Insufficient data");
	}
	const std::size_t train_rows = rows - test_rows;
	if (train_rows < std::max<std::size_t>(config_.min_train_rows, 1)) {
		throw core::InsufficientDataError("Insufficient data");
	}

	HoldoutSplit split;
	split.train_rows = train_rows;
	split.test_rows = test_rows;
	split.X_train = frame.matrix(0, train_rows);
	split.y_train = frame.targets(0, train_rows);
	split.X_test = frame.matrix(train_rows, rows);
	split.y_test = frame.targets(train_rows, rows);
	return split;
}

HoldoutEvaluation HoldoutEvaluator::evaluate(models::IRegressor &model, const features::FeatureFrame &frame) const {
	HoldoutEvaluation evaluation;
	evaluation.split = split(frame);

	model.fit(evaluation.split.X_train, evaluation.split.y_train);
	const Eigen::VectorXd predicted = model.predict(evaluation.split.X_test);

	const auto &y_test = evaluation.split.y_test;
	std::vector<double> actual(y_test.data(), y_test.data() + y_test.size());
	evaluation.test_predictions.assign(predicted.data(), predicted.data() + predicted.size());
	evaluation.metrics = utils::Metrics::score(actual, evaluation.test_predictions);

	RURALCREDIT_DEBUG("{} evaluated on {} train / {} test rows: RMSE {:.4f}.", model.getName(),
	                  evaluation.split.train_rows, evaluation.split.test_rows, evaluation.metrics.rmse);
	return evaluation;
}

} // namespace ruralcreditml::validation
