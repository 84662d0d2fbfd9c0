#pragma once

#include "aggregate_data.hpp"
#include "run_config.hpp"
#include "series_selector.hpp"

#include "ruralcredit-ml/core/forecast_result.hpp"
#include "ruralcredit-ml/forecast/forecast_pipeline.hpp"
#include "ruralcredit-ml/models/model_registry.hpp"

namespace ruralcredit {

/**
 * @class ForecastOrchestrator
 * @brief Runs every configured series against every configured model kind.
 *
 * A failing pair is recorded as an error marker and never stops the others.
 * ruralcreditml::core::DataFormatError raised while selecting a series propagates.
 */
class ForecastOrchestrator {
public:
	explicit ForecastOrchestrator(RunConfig config);
	ForecastOrchestrator(RunConfig config, ruralcreditml::models::ModelRegistry registry);

	ForecastOrchestrator(const ForecastOrchestrator &) = delete;
	ForecastOrchestrator &operator=(const ForecastOrchestrator &) = delete;

	ruralcreditml::core::ResultBundle run(const AggregateData &data) const;

	const ruralcreditml::models::ModelRegistry &registry() const {
		return registry_;
	}

private:
	RunConfig config_;
	ruralcreditml::models::ModelRegistry registry_;
	SeriesSelector selector_;
	ruralcreditml::forecast::ForecastPipeline pipeline_;
};

} // namespace ruralcredit
