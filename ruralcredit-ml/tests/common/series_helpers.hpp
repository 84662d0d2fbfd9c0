#pragma once

#include "ruralcredit-ml/core/observation.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

namespace tests::helpers {

inline std::vector<double> linearValues(double start, double step, std::size_t count) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(start + static_cast<double>(i) * step);
	}
	return values;
}

/// Trend plus a yearly sine, as seen in monthly credit volumes.
inline std::vector<double> seasonalValues(double level, double slope, double amplitude, std::size_t count) {
	constexpr double kTwoPi = 6.283185307179586476925286766559;
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		const double t = static_cast<double>(i);
		values.push_back(level + slope * t + amplitude * std::sin(kTwoPi * t / 12.0));
	}
	return values;
}

/// Consecutive monthly observations starting at @p start.
inline ruralcreditml::core::ObservationSeries makeMonthlySeries(const std::vector<double> &values,
                                                                ruralcreditml::core::Period start = {2013, 1}) {
	ruralcreditml::core::ObservationSeries series;
	series.reserve(values.size());
	ruralcreditml::core::Period period = start;
	for (double value : values) {
		ruralcreditml::core::Observation obs;
		obs.period = period;
		obs.value = value;
		series.push_back(obs);
		period = period.next();
	}
	return series;
}

/// One observation per year, all at the same placeholder month.
inline ruralcreditml::core::ObservationSeries makeAnnualSeries(const std::vector<double> &values, int first_year,
                                                               int month = 6) {
	ruralcreditml::core::ObservationSeries series;
	series.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		ruralcreditml::core::Observation obs;
		obs.period = {first_year + static_cast<int>(i), month};
		obs.value = values[i];
		series.push_back(obs);
	}
	return series;
}

} // namespace tests::helpers
