#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ruralcreditml::core {

/**
 * @struct PipelineConfig
 * @brief Tunables of the forecasting pipeline.
 *
 * Passed explicitly to every stage so tests can vary horizon, lags or windows
 * without touching shared state.
 */
struct PipelineConfig {
	int horizon = 24;                     // Future months to forecast
	std::size_t test_size = 12;           // Upper bound of the hold-out block
	std::vector<int> lags{1, 2, 3, 6, 12};
	std::vector<int> windows{3, 6, 12};
	std::size_t buffer_length = 12;       // Known values seeding the recursive buffer
	std::size_t min_observations = 24;    // Raw points required to attempt featurization
	std::size_t min_feature_rows = 12;    // Usable rows required after dropping
	std::size_t min_train_rows = 2;
	std::uint32_t seed = 42;
	int annual_placeholder_month = 6;

	// Dispersion proxy for the forecast bands
	double interval_scale = 0.15;
	double z_80 = 1.28;
	double z_95 = 1.96;

	/// Throws std::invalid_argument when a setting cannot produce a usable pipeline.
	void validate() const;
};

} // namespace ruralcreditml::core
