#pragma once

#include "aggregate_data.hpp"

#include "ruralcredit-ml/core/observation.hpp"

#include <string>
#include <vector>

namespace ruralcredit {

/**
 * @class SeriesSelector
 * @brief Extracts one observation sequence per series key from the aggregated views.
 *
 * "total" reads byMes, falling back to byAno. A category key reads the rows of
 * byFinalidadeMes whose category matches case-insensitively, falling back to
 * byFinalidade. Annual rows get a fixed placeholder month.
 */
class SeriesSelector {
public:
	static constexpr const char *kTotalKey = "total";

	SeriesSelector(std::vector<std::string> categories, int annual_placeholder_month = 6);

	/**
	 * @brief Returns the series for @p series_key sorted by period.
	 *
	 * An unknown key or a key without rows yields an empty sequence.
	 * @throws ruralcreditml::core::DataFormatError if two rows share a period.
	 */
	ruralcreditml::core::ObservationSeries select(const AggregateData &data, const std::string &series_key) const;

	bool isKnownKey(const std::string &series_key) const;

private:
	ruralcreditml::core::ObservationSeries fromRecords(const std::vector<const AggregateRecord *> &records,
	                                                   const std::string &series_key) const;

	std::vector<std::string> categories_;
	int annual_placeholder_month_;
};

/// ASCII lower-casing used for category matching.
std::string toLower(std::string text);

} // namespace ruralcredit
