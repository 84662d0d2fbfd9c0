#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

namespace ruralcreditml::utils {

/**
 * @struct AccuracyMetrics
 * @brief Hold-out accuracy of one fitted model.
 *
 * Every field is finite once computed by Metrics::score; NaN marks "not scored".
 */
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	double mape = std::numeric_limits<double>::quiet_NaN(); ///< Percent
	double r_squared = std::numeric_limits<double>::quiet_NaN();
	std::size_t n = 0;
};

/**
 * @class Metrics
 * @brief Point-forecast error measures over equally long actual/predicted vectors.
 *
 * All functions throw std::invalid_argument for empty or mismatched input.
 */
class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Mean absolute percentage error, in percent.
	 *
	 * Each error is divided by max(|actual|, machine epsilon), so zero actuals give a
	 * large but finite contribution instead of being skipped.
	 */
	static double mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Coefficient of determination.
	 *
	 * For constant actuals the ratio is undefined: a perfect prediction scores 1 and
	 * anything else scores 0.
	 */
	static double r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Computes the hold-out metric set reported for every forecast.
	static AccuracyMetrics score(const std::vector<double> &actual, const std::vector<double> &predicted);
};

/// Arithmetic mean; throws on empty input.
double mean(const std::vector<double> &values);

/// Population (ddof = 0) standard deviation; throws on empty input.
double populationStdDev(const std::vector<double> &values);

} // namespace ruralcreditml::utils
