#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "aggregate_reader.hpp"

#include "ruralcredit-ml/core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using nlohmann::json;
using ruralcredit::AggregateReader;
using ruralcreditml::core::DataFormatError;

TEST_CASE("Reader parses the four forecast views", "[app][reader]") {
	const auto document = json::parse(R"({
		"byMes": [{"ano": 2023, "mes": 1, "valor": 1500.5, "contratos": 12, "area": "33.5"}],
		"byAno": [{"ano": 2023, "valor": "2000"}],
		"byFinalidadeMes": [{"ano": 2023, "mes": 2, "finalidade": "Custeio", "valor": 10}],
		"byFinalidade": [{"ano": 2022, "finalidade": "investimento", "valor": null}],
		"byPrograma": [{"programa": "Pronaf"}]
	})");

	const auto data = AggregateReader::parse(document);
	REQUIRE(data.by_month.size() == 1);
	REQUIRE(data.by_month[0].year == 2023);
	REQUIRE(data.by_month[0].month == 1);
	REQUIRE(data.by_month[0].value == Catch::Approx(1500.5));
	REQUIRE(data.by_month[0].contracts == 12.0);
	REQUIRE(data.by_month[0].area == 33.5);

	REQUIRE(data.by_year.size() == 1);
	REQUIRE_FALSE(data.by_year[0].month.has_value());
	REQUIRE(data.by_year[0].value == Catch::Approx(2000.0));
	REQUIRE_FALSE(data.by_year[0].contracts.has_value());

	REQUIRE(data.by_category_month[0].category == std::string("Custeio"));
	REQUIRE(data.by_category_year[0].value == 0.0);
}

TEST_CASE("Reader coerces value-like fields", "[app][reader]") {
	REQUIRE(AggregateReader::coerceNumber(json(42)) == Catch::Approx(42.0));
	REQUIRE(AggregateReader::coerceNumber(json(1.5)) == Catch::Approx(1.5));
	REQUIRE(AggregateReader::coerceNumber(json("3.25")) == Catch::Approx(3.25));
	REQUIRE(AggregateReader::coerceNumber(json("12abc")) == 0.0);
	REQUIRE(AggregateReader::coerceNumber(json("")) == 0.0);
	REQUIRE(AggregateReader::coerceNumber(json(nullptr)) == 0.0);
	REQUIRE(AggregateReader::coerceNumber(json::array()) == 0.0);
	REQUIRE(AggregateReader::coerceNumber(json(true)) == 0.0);
}

TEST_CASE("Reader rejects structural violations", "[app][reader][error]") {
	REQUIRE_THROWS_AS(AggregateReader::parse(json::array()), DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byFinalidade": []})")), DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": {"ano": 2020}})")), DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [42]})")), DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [{"mes": 1, "valor": 5}]})")),
	                  DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [{"ano": 2020, "valor": 5}]})")),
	                  DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [{"ano": "soon", "mes": 1}]})")),
	                  DataFormatError);
	REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [{"ano": 2020, "mes": 13}]})")),
	                  DataFormatError);

	SECTION("years and months beyond the int range") {
		REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [{"ano": 1e12, "mes": 1}]})")),
		                  DataFormatError);
		REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byAno": [{"ano": -1e12}]})")), DataFormatError);
		REQUIRE_THROWS_AS(AggregateReader::parse(json::parse(R"({"byMes": [{"ano": 2020, "mes": "1e15"}]})")),
		                  DataFormatError);
	}

	SECTION("annual views do not need a month") {
		REQUIRE_NOTHROW(AggregateReader::parse(json::parse(R"({"byAno": [{"ano": "2020", "valor": 5}]})")));
	}
}

TEST_CASE("Reader loads files from disk", "[app][reader]") {
	const auto dir = std::filesystem::temp_directory_path() / "ruralcredit_reader_test";
	std::filesystem::create_directories(dir);
	const auto path = dir / "aggregated.json";
	{
		std::ofstream out(path);
		out << R"({"byMes": [{"ano": 2021, "mes": 5, "valor": 7}]})";
	}

	const auto data = AggregateReader::load(path.string());
	REQUIRE(data.by_month.size() == 1);
	REQUIRE(data.by_month[0].month == 5);

	SECTION("missing file") {
		REQUIRE_THROWS_AS(AggregateReader::load((dir / "absent.json").string()), DataFormatError);
	}

	SECTION("malformed JSON") {
		const auto broken = dir / "broken.json";
		{
			std::ofstream out(broken);
			out << "{\"byMes\": [";
		}
		REQUIRE_THROWS_AS(AggregateReader::load(broken.string()), DataFormatError);
	}

	std::filesystem::remove_all(dir);
}
