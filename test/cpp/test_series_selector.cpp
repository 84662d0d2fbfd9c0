#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "series_selector.hpp"

#include "ruralcredit-ml/core/errors.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using ruralcredit::AggregateData;
using ruralcredit::AggregateRecord;
using ruralcredit::SeriesSelector;
using ruralcreditml::core::Period;

namespace {

AggregateRecord record(int year, std::optional<int> month, double value,
                       std::optional<std::string> category = std::nullopt) {
	AggregateRecord r;
	r.year = year;
	r.month = month;
	r.value = value;
	r.category = std::move(category);
	return r;
}

const std::vector<std::string> kCategories{"custeio", "investimento", "comercializacao"};

} // namespace

TEST_CASE("Total prefers the monthly view and sorts it", "[app][selector]") {
	AggregateData data;
	data.by_month = {record(2023, 2, 20.0), record(2022, 12, 5.0), record(2023, 1, 10.0)};
	data.by_year = {record(2022, std::nullopt, 999.0)};

	const SeriesSelector selector{kCategories};
	const auto series = selector.select(data, "total");
	REQUIRE(series.size() == 3);
	REQUIRE(series[0].period == (Period{2022, 12}));
	REQUIRE(series[1].period == (Period{2023, 1}));
	REQUIRE(series[2].value == Catch::Approx(20.0));
}

TEST_CASE("Total falls back to annual rows at the placeholder month", "[app][selector]") {
	AggregateData data;
	for (int year = 2023; year >= 2013; --year) {
		data.by_year.push_back(record(year, std::nullopt, 1000.0 + year));
	}

	const SeriesSelector selector{kCategories};
	const auto series = selector.select(data, "total");
	REQUIRE(series.size() == 11);
	REQUIRE(series.front().period == (Period{2013, 6}));
	REQUIRE(series.back().period == (Period{2023, 6}));
}

TEST_CASE("Categories match case-insensitively with annual fallback", "[app][selector]") {
	AggregateData data;
	data.by_category_month = {record(2023, 3, 1.0, std::string("CUSTEIO")), record(2023, 1, 2.0, std::string("Custeio")),
	                          record(2023, 1, 9.0, std::string("investimento"))};
	data.by_category_year = {record(2020, std::nullopt, 7.0, std::string("Comercializacao")),
	                         record(2021, std::nullopt, 8.0, std::string("comercializacao")),
	                         record(2021, std::nullopt, 99.0, std::string("custeio"))};

	const SeriesSelector selector{kCategories};

	const auto custeio = selector.select(data, "custeio");
	REQUIRE(custeio.size() == 2);
	REQUIRE(custeio[0].period == (Period{2023, 1}));
	REQUIRE(custeio[0].value == Catch::Approx(2.0));

	const auto comercializacao = selector.select(data, "comercializacao");
	REQUIRE(comercializacao.size() == 2);
	REQUIRE(comercializacao[0].period == (Period{2020, 6}));

	REQUIRE(selector.select(data, "Investimento").size() == 1);
}

TEST_CASE("Unknown keys and empty views select nothing", "[app][selector]") {
	AggregateData data;
	data.by_month = {record(2023, 1, 1.0)};

	const SeriesSelector selector{kCategories};
	REQUIRE(selector.select(data, "pecuaria").empty());
	REQUIRE(selector.select(data, "custeio").empty());
	REQUIRE(selector.select(AggregateData{}, "total").empty());
}

TEST_CASE("Duplicate periods violate the data contract", "[app][selector][error]") {
	AggregateData data;
	data.by_month = {record(2023, 1, 1.0), record(2023, 1, 2.0)};

	const SeriesSelector selector{kCategories};
	REQUIRE_THROWS_AS(selector.select(data, "total"), ruralcreditml::core::DataFormatError);
	REQUIRE_THROWS_AS(SeriesSelector(kCategories, 0), std::invalid_argument);
}
