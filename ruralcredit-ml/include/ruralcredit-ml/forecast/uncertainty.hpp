#pragma once

#include "ruralcredit-ml/core/forecast_result.hpp"
#include "ruralcredit-ml/core/pipeline_config.hpp"

#include <vector>

namespace ruralcreditml::forecast {

struct IntervalBands {
	std::vector<double> lower_80;
	std::vector<double> upper_80;
	std::vector<double> lower_95;
	std::vector<double> upper_95;
};

/**
 * @class DispersionIntervals
 * @brief Symmetric bands from the spread of the point forecasts themselves.
 *
 * sigma = interval_scale * pstdev(predictions); the 80% and 95% bands are
 * prediction -/+ z * sigma, floored at zero. This conveys the magnitude of
 * uncertainty only and carries no coverage guarantee.
 */
class DispersionIntervals {
public:
	explicit DispersionIntervals(core::PipelineConfig config);

	/// Raw bands around the unfloored predictions.
	IntervalBands bands(const std::vector<double> &predictions) const;

	/**
	 * @brief Builds the reported forecast rows: point and bounds floored at zero.
	 * @throws std::invalid_argument if periods and predictions differ in length.
	 */
	std::vector<core::ForecastPoint> assemble(const std::vector<core::Period> &periods,
	                                          const std::vector<double> &predictions) const;

private:
	core::PipelineConfig config_;
};

} // namespace ruralcreditml::forecast
