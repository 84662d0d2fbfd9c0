#pragma once

#include "ruralcredit-ml/core/pipeline_config.hpp"

#include <spdlog/common.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ruralcredit {

/**
 * @struct RunConfig
 * @brief Settings of one batch run of the forecast generator.
 */
struct RunConfig {
	using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

	std::vector<std::string> series{"total", "custeio", "investimento", "comercializacao"};
	std::vector<std::string> models{"xgboost", "lightgbm", "randomforest"};
	std::string input_path = "dashboard/public/data/aggregated.json";
	std::string output_path = "dashboard/public/data/forecasts.json";
	spdlog::level::level_enum log_level = spdlog::level::info;
	std::vector<std::string> disabled_models;
	ruralcreditml::core::PipelineConfig pipeline;

	/// Category keys (every series key except "total").
	std::vector<std::string> categories() const;

	/**
	 * @brief Reads RURALCREDIT_INPUT, RURALCREDIT_OUTPUT, RURALCREDIT_LOG_LEVEL and
	 * RURALCREDIT_DISABLED_MODELS; unset or empty variables keep the defaults.
	 * @throws std::invalid_argument for an unknown log level.
	 */
	static RunConfig fromEnvironment();
	static RunConfig fromEnvironment(const EnvironmentLookup &lookup);
};

/// Splits a comma separated list, trimming blanks and dropping empty items.
std::vector<std::string> splitList(const std::string &text);

} // namespace ruralcredit
