#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "ruralcredit-ml/utils/metrics.hpp"

using ruralcreditml::utils::Metrics;

TEST_CASE("Metrics compute basic error statistics", "[utils][metrics]") {
	const std::vector<double> actual{1.0, 2.0, 3.0};
	const std::vector<double> predicted{1.5, 2.5, 2.0};

	const double expected_mse = (0.25 + 0.25 + 1.0) / 3.0;

	REQUIRE(Metrics::mae(actual, predicted) == Catch::Approx((0.5 + 0.5 + 1.0) / 3.0));
	REQUIRE(Metrics::mse(actual, predicted) == Catch::Approx(expected_mse));
	REQUIRE(Metrics::rmse(actual, predicted) == Catch::Approx(std::sqrt(expected_mse)));

	const double expected_mape = ((0.5 / 1.0) + (0.5 / 2.0) + (1.0 / 3.0)) / 3.0 * 100.0;
	REQUIRE(Metrics::mape(actual, predicted) == Catch::Approx(expected_mape).margin(1e-6));

	// ss_res = 1.5, ss_tot = 2
	REQUIRE(Metrics::r2(actual, predicted) == Catch::Approx(1.0 - 1.5 / 2.0));
}

TEST_CASE("Metrics handles invalid inputs", "[utils][metrics][error]") {
	const std::vector<double> actual{1.0, 2.0};
	const std::vector<double> predicted{1.0};

	REQUIRE_THROWS_AS(Metrics::mae(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::mape(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::r2(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::score({}, {}), std::invalid_argument);
}

TEST_CASE("MAPE floors the denominator at machine epsilon", "[utils][metrics][mape]") {
	const std::vector<double> actual{0.0, 10.0, 20.0};
	const std::vector<double> predicted{0.0, 11.0, 18.0};

	REQUIRE(Metrics::mape(actual, predicted) == Catch::Approx((0.0 + 0.1 + 0.1) / 3.0 * 100.0));

	SECTION("zero actuals with a miss stay finite") {
		const double mape = Metrics::mape({0.0, 0.0}, {1.0, 2.0});
		REQUIRE(std::isfinite(mape));
		const double eps = std::numeric_limits<double>::epsilon();
		REQUIRE(mape == Catch::Approx((1.0 / eps + 2.0 / eps) / 2.0 * 100.0));
	}
}

TEST_CASE("R2 for constant actuals is 1 when exact and 0 otherwise", "[utils][metrics][r2]") {
	const std::vector<double> actual{4.0, 4.0, 4.0};

	REQUIRE(Metrics::r2(actual, {3.0, 4.0, 5.0}) == 0.0);
	REQUIRE(Metrics::r2(actual, {4.0, 4.0, 4.0}) == 1.0);

	const auto metrics = Metrics::score(actual, {3.0, 4.0, 5.0});
	REQUIRE(metrics.n == 3);
	REQUIRE(metrics.r_squared == 0.0);
	REQUIRE(std::isfinite(metrics.mape));
	REQUIRE(std::isfinite(metrics.rmse));

	SECTION("all-zero actuals") {
		const auto zero = Metrics::score({0.0, 0.0}, {0.0, 0.0});
		REQUIRE(zero.mape == 0.0);
		REQUIRE(zero.r_squared == 1.0);
		REQUIRE(zero.rmse == 0.0);
	}
}

TEST_CASE("Mean and population standard deviation", "[utils][metrics][stats]") {
	const std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

	REQUIRE(ruralcreditml::utils::mean(values) == Catch::Approx(5.0));
	REQUIRE(ruralcreditml::utils::populationStdDev(values) == Catch::Approx(2.0));
	REQUIRE(ruralcreditml::utils::populationStdDev({3.0}) == Catch::Approx(0.0));
	REQUIRE_THROWS_AS(ruralcreditml::utils::mean({}), std::invalid_argument);
}
