#include "ruralcredit-ml/core/pipeline_config.hpp"

#include <stdexcept>

namespace ruralcreditml::core {

void PipelineConfig::validate() const {
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (test_size == 0) {
		throw std::invalid_argument("Test size must be positive.");
	}
	if (buffer_length == 0) {
		throw std::invalid_argument("Rolling buffer length must be positive.");
	}
	for (int lag : lags) {
		if (lag <= 0) {
			throw std::invalid_argument("Lag offsets must be positive.");
		}
	}
	for (int window : windows) {
		if (window <= 0) {
			throw std::invalid_argument("Rolling windows must be positive.");
		}
	}
	if (annual_placeholder_month < 1 || annual_placeholder_month > 12) {
		throw std::invalid_argument("Placeholder month must lie in [1, 12].");
	}
	if (interval_scale < 0.0 || z_80 < 0.0 || z_95 < z_80) {
		throw std::invalid_argument("Interval settings must satisfy 0 <= z_80 <= z_95 and a non-negative scale.");
	}
}

} // namespace ruralcreditml::core
