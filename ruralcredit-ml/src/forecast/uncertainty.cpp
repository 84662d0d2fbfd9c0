#include "ruralcredit-ml/forecast/uncertainty.hpp"

#include "ruralcredit-ml/utils/metrics.hpp"

#include <algorithm>
#include <stdexcept>

namespace ruralcreditml::forecast {

DispersionIntervals::DispersionIntervals(core::PipelineConfig config) : config_(std::move(config)) {
	config_.validate();
}

IntervalBands DispersionIntervals::bands(const std::vector<double> &predictions) const {
	IntervalBands bands;
	if (predictions.empty()) {
		return bands;
	}
	const double sigma = config_.interval_scale * utils::populationStdDev(predictions);

	bands.lower_80.reserve(predictions.size());
	bands.upper_80.reserve(predictions.size());
	bands.lower_95.reserve(predictions.size());
	bands.upper_95.reserve(predictions.size());
	for (double p : predictions) {
		bands.lower_80.push_back(p - config_.z_80 * sigma);
		bands.upper_80.push_back(p + config_.z_80 * sigma);
		bands.lower_95.push_back(p - config_.z_95 * sigma);
		bands.upper_95.push_back(p + config_.z_95 * sigma);
	}
	return bands;
}

std::vector<core::ForecastPoint> DispersionIntervals::assemble(const std::vector<core::Period> &periods,
                                                               const std::vector<double> &predictions) const {
	if (periods.size() != predictions.size()) {
		throw std::invalid_argument("Forecast periods and predictions must have the same length.");
	}
	const auto raw = bands(predictions);

	std::vector<core::ForecastPoint> points;
	points.reserve(predictions.size());
	for (std::size_t i = 0; i < predictions.size(); ++i) {
		core::ForecastPoint point;
		point.period = periods[i];
		point.value = std::max(0.0, predictions[i]);
		point.lower_80 = std::max(0.0, raw.lower_80[i]);
		point.upper_80 = std::max(0.0, raw.upper_80[i]);
		point.lower_95 = std::max(0.0, raw.lower_95[i]);
		point.upper_95 = std::max(0.0, raw.upper_95[i]);
		points.push_back(point);
	}
	return points;
}

} // namespace ruralcreditml::forecast
