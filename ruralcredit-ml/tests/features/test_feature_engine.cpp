#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/features/feature_engine.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using ruralcreditml::core::InsufficientDataError;
using ruralcreditml::core::PipelineConfig;
using ruralcreditml::features::FeatureEngine;

TEST_CASE("Feature columns follow the configured order", "[features][engine]") {
	const FeatureEngine engine{PipelineConfig{}};
	const std::vector<std::string> expected{"year",           "month",          "month_sin",      "month_cos",
	                                        "trend",          "lag_1",          "lag_2",          "lag_3",
	                                        "lag_6",          "lag_12",         "rolling_mean_3", "rolling_std_3",
	                                        "rolling_mean_6", "rolling_std_6",  "rolling_mean_12", "rolling_std_12"};
	REQUIRE(engine.columnNames() == expected);
}

TEST_CASE("Featurize drops rows without full history", "[features][engine]") {
	const FeatureEngine engine{PipelineConfig{}};
	const auto series = tests::helpers::makeMonthlySeries(tests::helpers::linearValues(0.0, 1.0, 48), {2015, 1});

	const auto frame = engine.featurize(series);
	REQUIRE(frame.source_length == 48);
	REQUIRE(frame.size() == 36);
	REQUIRE(frame.columns.size() == 16);

	const auto &first = frame.rows.front();
	REQUIRE(first.trend == 12);
	REQUIRE(first.period == ruralcreditml::core::Period{2016, 1});
	REQUIRE(first.target == Catch::Approx(12.0));

	const auto value = [&](const std::string &column) { return first.values[frame.columnIndex(column)]; };
	REQUIRE(value("year") == Catch::Approx(2016.0));
	REQUIRE(value("month") == Catch::Approx(1.0));
	REQUIRE(value("trend") == Catch::Approx(12.0));
	REQUIRE(value("lag_1") == Catch::Approx(11.0));
	REQUIRE(value("lag_6") == Catch::Approx(6.0));
	REQUIRE(value("lag_12") == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(value("rolling_mean_3") == Catch::Approx(11.0));
	REQUIRE(value("rolling_std_3") == Catch::Approx(std::sqrt(2.0 / 3.0)));
	REQUIRE(value("rolling_mean_12") == Catch::Approx(6.5));

	SECTION("trend keeps counting over the original sequence") {
		REQUIRE(frame.rows.back().trend == 47);
		REQUIRE(frame.rows.back().period == ruralcreditml::core::Period{2018, 12});
	}
}

TEST_CASE("Cyclical month encoding", "[features][engine]") {
	const auto march = ruralcreditml::features::cyclicalMonth(3);
	REQUIRE(march.first == Catch::Approx(1.0));
	REQUIRE(march.second == Catch::Approx(0.0).margin(1e-12));

	const auto december = ruralcreditml::features::cyclicalMonth(12);
	REQUIRE(december.first == Catch::Approx(0.0).margin(1e-12));
	REQUIRE(december.second == Catch::Approx(1.0));
}

TEST_CASE("Featurize rejects short series", "[features][engine][error]") {
	const FeatureEngine engine{PipelineConfig{}};

	SECTION("fewer raw observations than the minimum") {
		const auto series = tests::helpers::makeMonthlySeries(tests::helpers::linearValues(1.0, 1.0, 23));
		REQUIRE_THROWS_AS(engine.featurize(series), InsufficientDataError);
		try {
			engine.featurize(series);
		} catch (const InsufficientDataError &e) {
			REQUIRE(std::string(e.what()) == "Insufficient data");
		}
	}

	SECTION("exactly the minimum survives with twelve rows") {
		const auto series = tests::helpers::makeMonthlySeries(tests::helpers::linearValues(1.0, 1.0, 24));
		REQUIRE(engine.featurize(series).size() == 12);
	}

	SECTION("too few rows after the drop") {
		PipelineConfig config;
		config.min_observations = 20;
		const FeatureEngine relaxed{config};
		const auto series = tests::helpers::makeMonthlySeries(tests::helpers::linearValues(1.0, 1.0, 20));
		try {
			relaxed.featurize(series);
			FAIL("Expected InsufficientDataError");
		} catch (const InsufficientDataError &e) {
			REQUIRE(std::string(e.what()) == "Insufficient data after feature creation");
		}
	}

	SECTION("empty series") {
		REQUIRE_THROWS_AS(engine.featurize({}), InsufficientDataError);
	}
}

TEST_CASE("Feature frame slices rows in order", "[features][frame]") {
	const FeatureEngine engine{PipelineConfig{}};
	const auto frame =
	    engine.featurize(tests::helpers::makeMonthlySeries(tests::helpers::linearValues(100.0, 2.0, 30)));

	const auto X = frame.matrix(2, 5);
	const auto y = frame.targets(2, 5);
	REQUIRE(X.rows() == 3);
	REQUIRE(X.cols() == 16);
	REQUIRE(y(0) == Catch::Approx(frame.rows[2].target));
	REQUIRE(X(2, frame.columnIndex("trend")) == Catch::Approx(static_cast<double>(frame.rows[4].trend)));

	const auto tail = frame.trailingTargets(4);
	REQUIRE(tail.size() == 4);
	REQUIRE(tail.back() == Catch::Approx(frame.rows.back().target));
	REQUIRE(frame.trailingTargets(100).size() == frame.size());

	REQUIRE_THROWS_AS(frame.matrix(5, 2), std::out_of_range);
	REQUIRE_THROWS_AS(frame.columnIndex("lag_24"), std::out_of_range);
}
