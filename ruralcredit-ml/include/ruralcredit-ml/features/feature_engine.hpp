#pragma once

#include "ruralcredit-ml/core/observation.hpp"
#include "ruralcredit-ml/core/pipeline_config.hpp"
#include "ruralcredit-ml/features/feature_frame.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ruralcreditml::features {

/**
 * @struct RollingStat
 * @brief Mean and population standard deviation of one trailing window.
 */
struct RollingStat {
	double mean = 0.0;
	double std_dev = 0.0;
};

/**
 * @class FeatureEngine
 * @brief Derives lag, rolling, calendar, cyclical and trend features from a series.
 *
 * Column order is fixed by the configuration:
 * year, month, month_sin, month_cos, trend, lag_<k>..., then
 * rolling_mean_<w>, rolling_std_<w> for every window.
 */
class FeatureEngine {
public:
	explicit FeatureEngine(core::PipelineConfig config);

	/**
	 * @brief Builds the usable feature rows of a series.
	 * @param observations Series sorted by period.
	 * @return Frame holding only rows whose look-back features are all defined.
	 * @throws core::InsufficientDataError if the series is shorter than the configured
	 *         minimum, or too few rows survive the drop.
	 */
	FeatureFrame featurize(const core::ObservationSeries &observations) const;

	/// Column names in the order used by every feature row.
	std::vector<std::string> columnNames() const;

	/**
	 * @brief Assembles one feature vector in column order.
	 *
	 * Shared by the history featurization and the recursive forecaster so both
	 * produce identically shaped rows.
	 */
	std::vector<double> composeRow(const core::Period &period, std::size_t trend, const std::vector<double> &lag_values,
	                               const std::vector<RollingStat> &rolling) const;

	const core::PipelineConfig &config() const {
		return config_;
	}

private:
	std::size_t requiredHistory() const;

	core::PipelineConfig config_;
};

/// sin(2*pi*month/12) and cos(2*pi*month/12)
std::pair<double, double> cyclicalMonth(int month);

} // namespace ruralcreditml::features
