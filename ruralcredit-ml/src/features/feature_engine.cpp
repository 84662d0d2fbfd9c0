#include "ruralcredit-ml/features/feature_engine.hpp"

#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace ruralcreditml::features {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

RollingStat window_stat(const std::vector<double> &values, std::size_t end, std::size_t window) {
	// Window covers [end - window + 1, end]
	const std::size_t begin = end + 1 - window;
	double sum = 0.0;
	for (std::size_t i = begin; i <= end; ++i) {
		sum += values[i];
	}
	const double mean = sum / static_cast<double>(window);
	double sum_sq = 0.0;
	for (std::size_t i = begin; i <= end; ++i) {
		sum_sq += (values[i] - mean) * (values[i] - mean);
	}
	return RollingStat{mean, std::sqrt(sum_sq / static_cast<double>(window))};
}

} // namespace

std::pair<double, double> cyclicalMonth(int month) {
	const double angle = kTwoPi * static_cast<double>(month) / 12.0;
	return {std::sin(angle), std::cos(angle)};
}

FeatureEngine::FeatureEngine(core::PipelineConfig config) : config_(std::move(config)) {
	config_.validate();
}

std::vector<std::string> FeatureEngine::columnNames() const {
	std::vector<std::string> names{"year", "month", "month_sin", "month_cos", "trend"};
	for (int lag : config_.lags) {
		names.push_back("lag_" + std::to_string(lag));
	}
	for (int window : config_.windows) {
		names.push_back("rolling_mean_" + std::to_string(window));
		names.push_back("rolling_std_" + std::to_string(window));
	}
	return names;
}

std::vector<double> FeatureEngine::composeRow(const core::Period &period, std::size_t trend,
                                              const std::vector<double> &lag_values,
                                              const std::vector<RollingStat> &rolling) const {
	if (lag_values.size() != config_.lags.size() || rolling.size() != config_.windows.size()) {
		throw std::invalid_argument("Lag and rolling inputs must match the configured offsets and windows.");
	}
	const auto cyclical = cyclicalMonth(period.month);

	std::vector<double> row;
	row.reserve(5 + lag_values.size() + 2 * rolling.size());
	row.push_back(static_cast<double>(period.year));
	row.push_back(static_cast<double>(period.month));
	row.push_back(cyclical.first);
	row.push_back(cyclical.second);
	row.push_back(static_cast<double>(trend));
	row.insert(row.end(), lag_values.begin(), lag_values.end());
	for (const auto &stat : rolling) {
		row.push_back(stat.mean);
		row.push_back(stat.std_dev);
	}
	return row;
}

std::size_t FeatureEngine::requiredHistory() const {
	std::size_t required = 0;
	for (int lag : config_.lags) {
		required = std::max(required, static_cast<std::size_t>(lag));
	}
	for (int window : config_.windows) {
		required = std::max(required, static_cast<std::size_t>(window - 1));
	}
	return required;
}

FeatureFrame FeatureEngine::featurize(const core::ObservationSeries &observations) const {
	if (observations.empty() || observations.size() < config_.min_observations) {
		throw core::InsufficientDataError("Insufficient data");
	}

	std::vector<double> values;
	values.reserve(observations.size());
	for (const auto &obs : observations) {
		values.push_back(obs.value);
	}

	FeatureFrame frame;
	frame.columns = columnNames();
	frame.source_length = observations.size();

	const std::size_t first_usable = requiredHistory();
	std::vector<double> lag_values(config_.lags.size());
	std::vector<RollingStat> rolling(config_.windows.size());

	for (std::size_t t = first_usable; t < observations.size(); ++t) {
		for (std::size_t i = 0; i < config_.lags.size(); ++i) {
			lag_values[i] = values[t - static_cast<std::size_t>(config_.lags[i])];
		}
		for (std::size_t i = 0; i < config_.windows.size(); ++i) {
			rolling[i] = window_stat(values, t, static_cast<std::size_t>(config_.windows[i]));
		}

		FeatureRow row;
		row.period = observations[t].period;
		row.trend = t;
		row.target = values[t];
		row.values = composeRow(row.period, t, lag_values, rolling);
		frame.rows.push_back(std::move(row));
	}

	RURALCREDIT_DEBUG("Featurized {} observations into {} usable rows ({} dropped).", observations.size(),
	                  frame.size(), observations.size() - frame.size());

	if (frame.size() < config_.min_feature_rows) {
		throw core::InsufficientDataError("Insufficient data after feature creation");
	}
	return frame;
}

} // namespace ruralcreditml::features
