#include "ruralcredit-ml/forecast/recursive_forecaster.hpp"

#include "ruralcredit-ml/utils/logging.hpp"
#include "ruralcredit-ml/utils/metrics.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace ruralcreditml::forecast {

RecursiveForecaster::RecursiveForecaster(features::FeatureEngine engine) : engine_(std::move(engine)) {
}

RecursiveForecast RecursiveForecaster::simulate(const features::FeatureFrame &frame, int horizon) const {
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (frame.empty()) {
		throw std::invalid_argument("Cannot forecast from an empty feature frame.");
	}

	const auto &config = engine_.config();
	const core::Period last_period = frame.rows.back().period;
	std::vector<double> buffer = frame.trailingTargets(config.buffer_length);

	RecursiveForecast result;
	result.periods.reserve(static_cast<std::size_t>(horizon));
	result.features.resize(horizon, static_cast<Eigen::Index>(frame.columns.size()));

	std::vector<double> lag_values(config.lags.size());
	std::vector<features::RollingStat> rolling(config.windows.size());

	for (int h = 1; h <= horizon; ++h) {
		const core::Period period = last_period.advance(h);
		const std::size_t trend = frame.source_length + static_cast<std::size_t>(h) - 1;

		const double buffer_mean = utils::mean(buffer);
		for (std::size_t i = 0; i < config.lags.size(); ++i) {
			const auto lag = static_cast<std::size_t>(config.lags[i]);
			lag_values[i] = lag <= buffer.size() ? buffer[buffer.size() - lag] : buffer_mean;
		}

		for (std::size_t i = 0; i < config.windows.size(); ++i) {
			const auto window = static_cast<std::size_t>(config.windows[i]);
			const std::size_t take = std::min(window, buffer.size());
			const std::vector<double> window_values(buffer.end() - static_cast<std::ptrdiff_t>(take), buffer.end());
			rolling[i].mean = utils::mean(window_values);
			rolling[i].std_dev = window_values.size() > 1 ? utils::populationStdDev(window_values) : 0.0;
		}

		const auto row = engine_.composeRow(period, trend, lag_values, rolling);
		for (std::size_t j = 0; j < row.size(); ++j) {
			result.features(h - 1, static_cast<Eigen::Index>(j)) = row[j];
		}
		result.periods.push_back(period);

		// Carry the last known value forward; the model's prediction is not fed back.
		buffer.push_back(buffer.back());
	}
	return result;
}

RecursiveForecast RecursiveForecaster::forecast(const models::IRegressor &model, const features::FeatureFrame &frame,
                                                int horizon) const {
	RecursiveForecast result = simulate(frame, horizon);
	if (horizon == 0) {
		return result;
	}
	const Eigen::VectorXd predicted = model.predict(result.features);
	result.predictions.assign(predicted.data(), predicted.data() + predicted.size());
	RURALCREDIT_DEBUG("{} forecast {} steps from {}-{:02d}.", model.getName(), horizon,
	                  frame.rows.back().period.year, frame.rows.back().period.month);
	return result;
}

} // namespace ruralcreditml::forecast
