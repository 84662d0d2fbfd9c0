#pragma once

#include "ruralcredit-ml/core/forecast_result.hpp"
#include "ruralcredit-ml/core/observation.hpp"
#include "ruralcredit-ml/core/pipeline_config.hpp"
#include "ruralcredit-ml/features/feature_engine.hpp"
#include "ruralcredit-ml/forecast/recursive_forecaster.hpp"
#include "ruralcredit-ml/forecast/uncertainty.hpp"
#include "ruralcredit-ml/models/model_registry.hpp"
#include "ruralcredit-ml/validation/holdout_evaluator.hpp"

#include <string>

namespace ruralcreditml::forecast {

/**
 * @class ForecastPipeline
 * @brief Runs featurize -> fit -> evaluate -> forecast -> bands for one series/model pair.
 *
 * Insufficient data and unavailable models come back as error outcomes; every other
 * exception propagates to the caller.
 */
class ForecastPipeline {
public:
	ForecastPipeline(core::PipelineConfig config, const models::ModelRegistry &registry);

	/**
	 * @brief Produces the forecast of one series with one model kind.
	 * @param observations Series sorted by period.
	 * @param model_name Registry name of the model kind.
	 */
	core::PairOutcome run(const core::ObservationSeries &observations, const std::string &model_name) const;

	const core::PipelineConfig &config() const {
		return config_;
	}

private:
	core::PipelineConfig config_;
	const models::ModelRegistry &registry_;
	features::FeatureEngine engine_;
	validation::HoldoutEvaluator evaluator_;
	RecursiveForecaster forecaster_;
	DispersionIntervals intervals_;
};

} // namespace ruralcreditml::forecast
