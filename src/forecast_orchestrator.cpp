#include "forecast_orchestrator.hpp"

#include "ruralcredit-ml/utils/logging.hpp"

#include <exception>

namespace ruralcredit {

using ruralcreditml::core::PairOutcome;

ForecastOrchestrator::ForecastOrchestrator(RunConfig config)
    : ForecastOrchestrator(std::move(config), ruralcreditml::models::ModelRegistry::withDefaults()) {
}

ForecastOrchestrator::ForecastOrchestrator(RunConfig config, ruralcreditml::models::ModelRegistry registry)
    : config_(std::move(config)), registry_(std::move(registry)),
      selector_(config_.categories(), config_.pipeline.annual_placeholder_month), pipeline_(config_.pipeline, registry_) {
	config_.pipeline.validate();
	for (const auto &name : config_.disabled_models) {
		registry_.disable(name);
	}
}

ruralcreditml::core::ResultBundle ForecastOrchestrator::run(const AggregateData &data) const {
	ruralcreditml::core::ResultBundle bundle;

	for (const auto &series_key : config_.series) {
		const auto observations = selector_.select(data, series_key);
		auto &outcomes = bundle.add(series_key);

		RURALCREDIT_INFO("Series '{}': {} data points.", series_key, observations.size());
		if (observations.empty()) {
			RURALCREDIT_WARN("No data for series '{}'; skipping.", series_key);
			continue;
		}

		for (const auto &model_name : config_.models) {
			RURALCREDIT_INFO("  Training {} on '{}'...", model_name, series_key);
			try {
				auto outcome = pipeline_.run(observations, model_name);
				if (outcome.ok()) {
					const auto &metrics = outcome.result().metrics;
					RURALCREDIT_INFO("    MAPE: {:.2f}%, R2: {:.4f}", metrics.mape, metrics.r_squared);
				} else {
					RURALCREDIT_WARN("    {}", outcome.error());
				}
				outcomes.emplace(model_name, std::move(outcome));
			} catch (const std::exception &e) {
				RURALCREDIT_ERROR("    {} on '{}' failed: {}", model_name, series_key, e.what());
				outcomes.emplace(model_name, PairOutcome::failure(e.what()));
			}
		}
	}
	return bundle;
}

} // namespace ruralcredit
