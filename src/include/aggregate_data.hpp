#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ruralcredit {

/**
 * @struct AggregateRecord
 * @brief One row of an aggregated view (ano/mes/valor/contratos/area/finalidade).
 */
struct AggregateRecord {
	int year = 0;
	std::optional<int> month;
	double value = 0.0;
	std::optional<double> contracts;
	std::optional<double> area;
	std::optional<std::string> category;
};

/**
 * @struct AggregateData
 * @brief The views of aggregated.json that feed the forecasts.
 */
struct AggregateData {
	std::vector<AggregateRecord> by_month;          // byMes
	std::vector<AggregateRecord> by_year;           // byAno
	std::vector<AggregateRecord> by_category_month; // byFinalidadeMes
	std::vector<AggregateRecord> by_category_year;  // byFinalidade
};

} // namespace ruralcredit
