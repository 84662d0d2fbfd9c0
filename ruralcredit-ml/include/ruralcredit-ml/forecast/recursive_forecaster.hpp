#pragma once

#include "ruralcredit-ml/core/observation.hpp"
#include "ruralcredit-ml/features/feature_engine.hpp"
#include "ruralcredit-ml/features/feature_frame.hpp"
#include "ruralcredit-ml/models/iregressor.hpp"

#include <Eigen/Dense>
#include <vector>

namespace ruralcreditml::forecast {

/**
 * @struct RecursiveForecast
 * @brief Simulated future feature vectors and the model output for each of them.
 */
struct RecursiveForecast {
	std::vector<core::Period> periods;
	Eigen::MatrixXd features;
	std::vector<double> predictions; ///< Raw model output, not yet floored
};

/**
 * @class RecursiveForecaster
 * @brief Builds future feature vectors one month at a time and predicts them.
 *
 * A rolling buffer is seeded with the trailing known values. At every step the lag
 * and rolling features are read from the buffer, and the buffer then advances by
 * repeating its last value. The model's own prediction is never fed back, so step
 * h+1 does not depend on the forecast at step h.
 */
class RecursiveForecaster {
public:
	explicit RecursiveForecaster(features::FeatureEngine engine);

	/**
	 * @brief Simulates @p horizon future feature vectors after the last row of @p frame.
	 *
	 * Periods follow the last observed period with month/year carry; the trend index
	 * continues from the original sequence length.
	 */
	RecursiveForecast simulate(const features::FeatureFrame &frame, int horizon) const;

	/**
	 * @brief Simulates the future features and predicts them with a fitted model.
	 */
	RecursiveForecast forecast(const models::IRegressor &model, const features::FeatureFrame &frame,
	                           int horizon) const;

private:
	features::FeatureEngine engine_;
};

} // namespace ruralcreditml::forecast
