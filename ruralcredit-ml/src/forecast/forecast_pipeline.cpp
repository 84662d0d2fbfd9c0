#include "ruralcredit-ml/forecast/forecast_pipeline.hpp"

#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

namespace ruralcreditml::forecast {

ForecastPipeline::ForecastPipeline(core::PipelineConfig config, const models::ModelRegistry &registry)
    : config_(std::move(config)), registry_(registry), engine_(config_), evaluator_(config_), forecaster_(engine_),
      intervals_(config_) {
}

core::PairOutcome ForecastPipeline::run(const core::ObservationSeries &observations,
                                        const std::string &model_name) const {
	try {
		const auto frame = engine_.featurize(observations);
		auto model = registry_.create(model_name, config_);

		const auto evaluation = evaluator_.evaluate(*model, frame);
		const auto simulated = forecaster_.forecast(*model, frame, config_.horizon);

		core::ForecastResult result;
		result.metrics = evaluation.metrics;
		result.points = intervals_.assemble(simulated.periods, simulated.predictions);
		return core::PairOutcome::success(std::move(result));
	} catch (const core::InsufficientDataError &e) {
		RURALCREDIT_DEBUG("{}: {}", model_name, e.what());
		return core::PairOutcome::failure(e.what());
	} catch (const core::ModelUnavailableError &e) {
		RURALCREDIT_DEBUG("{}: {}", model_name, e.what());
		return core::PairOutcome::failure(e.what());
	}
}

} // namespace ruralcreditml::forecast
