#include "series_selector.hpp"

#include "ruralcredit-ml/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ruralcredit {

using ruralcreditml::core::DataFormatError;
using ruralcreditml::core::Observation;
using ruralcreditml::core::ObservationSeries;
using ruralcreditml::core::Period;

std::string toLower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

SeriesSelector::SeriesSelector(std::vector<std::string> categories, int annual_placeholder_month)
    : categories_(std::move(categories)), annual_placeholder_month_(annual_placeholder_month) {
	if (annual_placeholder_month_ < 1 || annual_placeholder_month_ > 12) {
		throw std::invalid_argument("Annual placeholder month must be in 1..12.");
	}
	for (auto &category : categories_) {
		category = toLower(category);
	}
}

bool SeriesSelector::isKnownKey(const std::string &series_key) const {
	if (series_key == kTotalKey) {
		return true;
	}
	return std::find(categories_.begin(), categories_.end(), toLower(series_key)) != categories_.end();
}

ObservationSeries SeriesSelector::select(const AggregateData &data, const std::string &series_key) const {
	if (!isKnownKey(series_key)) {
		return {};
	}

	std::vector<const AggregateRecord *> records;
	if (series_key == kTotalKey) {
		const auto &view = data.by_month.empty() ? data.by_year : data.by_month;
		for (const auto &record : view) {
			records.push_back(&record);
		}
		return fromRecords(records, series_key);
	}

	const auto key = toLower(series_key);
	const auto collect = [&](const std::vector<AggregateRecord> &view) {
		for (const auto &record : view) {
			if (record.category && toLower(*record.category) == key) {
				records.push_back(&record);
			}
		}
	};
	collect(data.by_category_month);
	if (records.empty()) {
		collect(data.by_category_year);
	}
	return fromRecords(records, series_key);
}

ObservationSeries SeriesSelector::fromRecords(const std::vector<const AggregateRecord *> &records,
                                              const std::string &series_key) const {
	ObservationSeries series;
	series.reserve(records.size());
	for (const auto *record : records) {
		Observation observation;
		observation.period = Period{record->year, record->month.value_or(annual_placeholder_month_)};
		observation.value = record->value;
		observation.contracts = record->contracts;
		observation.area = record->area;
		series.push_back(observation);
	}

	std::stable_sort(series.begin(), series.end(),
	                 [](const Observation &a, const Observation &b) { return a.period < b.period; });

	const auto duplicate = std::adjacent_find(
	    series.begin(), series.end(), [](const Observation &a, const Observation &b) { return a.period == b.period; });
	if (duplicate != series.end()) {
		throw DataFormatError("Series '" + series_key + "' has two rows for " + std::to_string(duplicate->period.year) +
		                      "-" + std::to_string(duplicate->period.month) + ".");
	}
	return series;
}

} // namespace ruralcredit
