#pragma once

#include "ruralcredit-ml/core/forecast_result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace ruralcredit {

/**
 * @class ResultWriter
 * @brief Serializes a result bundle to the forecasts.json layout read by the dashboard.
 */
class ResultWriter {
public:
	static nlohmann::json toJson(const ruralcreditml::core::ResultBundle &bundle);
	static nlohmann::json toJson(const ruralcreditml::core::PairOutcome &outcome);
	static nlohmann::json toJson(const ruralcreditml::utils::AccuracyMetrics &metrics);

	/**
	 * @brief Writes the bundle pretty-printed, creating the parent directory when missing.
	 * @return Size of the written file in bytes.
	 * @throws std::runtime_error if the file cannot be written.
	 */
	static std::uintmax_t write(const ruralcreditml::core::ResultBundle &bundle, const std::string &path);
};

} // namespace ruralcredit
