#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "result_writer.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using nlohmann::json;
using ruralcredit::ResultWriter;
using ruralcreditml::core::ForecastPoint;
using ruralcreditml::core::ForecastResult;
using ruralcreditml::core::PairOutcome;
using ruralcreditml::core::ResultBundle;

namespace {

ResultBundle sampleBundle() {
	ForecastResult result;
	ForecastPoint point;
	point.period = {2024, 1};
	point.value = 100.0;
	point.lower_80 = 90.0;
	point.upper_80 = 110.0;
	point.lower_95 = 85.0;
	point.upper_95 = 115.0;
	result.points.push_back(point);
	result.metrics.mape = 3.5;
	result.metrics.rmse = 12.0;

	ResultBundle bundle;
	auto &total = bundle.add("total");
	total.emplace("xgboost", PairOutcome::success(result));
	total.emplace("lightgbm", PairOutcome::failure("Insufficient data"));
	bundle.add("custeio");
	return bundle;
}

} // namespace

TEST_CASE("Bundle serializes to the dashboard layout", "[app][writer]") {
	const auto document = ResultWriter::toJson(sampleBundle());

	REQUIRE(document.is_object());
	REQUIRE(document["custeio"].is_object());
	REQUIRE(document["custeio"].empty());

	const auto &xgboost = document["total"]["xgboost"];
	REQUIRE(xgboost["predictions"].size() == 1);
	const auto &row = xgboost["predictions"][0];
	REQUIRE(row["year"] == 2024);
	REQUIRE(row["month"] == 1);
	REQUIRE(row["value"].get<double>() == Catch::Approx(100.0));
	REQUIRE(row["lower_80"].get<double>() == Catch::Approx(90.0));
	REQUIRE(row["upper_95"].get<double>() == Catch::Approx(115.0));

	REQUIRE(xgboost["metrics"]["mape"].get<double>() == Catch::Approx(3.5));
	REQUIRE(xgboost["metrics"]["rmse"].get<double>() == Catch::Approx(12.0));
	REQUIRE(xgboost["metrics"]["r2"].is_null());
	REQUIRE(xgboost["mape"] == xgboost["metrics"]["mape"]);
	REQUIRE(xgboost["r2"].is_null());

	REQUIRE(document["total"]["lightgbm"] == json{{"error", "Insufficient data"}});
}

TEST_CASE("Non-finite metrics are written as null", "[app][writer]") {
	ruralcreditml::utils::AccuracyMetrics metrics;
	metrics.r_squared = 0.75;
	const auto encoded = ResultWriter::toJson(metrics);
	REQUIRE(encoded["rmse"].is_null());
	REQUIRE(encoded["mape"].is_null());
	REQUIRE(encoded["r2"].get<double>() == Catch::Approx(0.75));
}

TEST_CASE("Writer creates the output directory", "[app][writer]") {
	const auto dir = std::filesystem::temp_directory_path() / "ruralcredit_writer_test";
	std::filesystem::remove_all(dir);
	const auto path = dir / "nested" / "forecasts.json";

	const auto size = ResultWriter::write(sampleBundle(), path.string());
	REQUIRE(std::filesystem::exists(path));
	REQUIRE(size == std::filesystem::file_size(path));

	std::ifstream in(path);
	const auto reread = json::parse(in);
	REQUIRE(reread == ResultWriter::toJson(sampleBundle()));

	std::filesystem::remove_all(dir);
}
