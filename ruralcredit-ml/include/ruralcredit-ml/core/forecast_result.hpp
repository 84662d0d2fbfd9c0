#pragma once

#include "ruralcredit-ml/core/observation.hpp"
#include "ruralcredit-ml/utils/metrics.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ruralcreditml::core {

/**
 * @struct ForecastPoint
 * @brief One future period with its point forecast and interval bounds.
 */
struct ForecastPoint {
	Period period;
	double value = 0.0;
	double lower_80 = 0.0;
	double upper_80 = 0.0;
	double lower_95 = 0.0;
	double upper_95 = 0.0;
};

/**
 * @struct ForecastResult
 * @brief Forecast rows of one series/model pair plus hold-out accuracy.
 */
struct ForecastResult {
	std::vector<ForecastPoint> points;
	utils::AccuracyMetrics metrics;

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return points.size();
	}

	bool empty() const {
		return points.empty();
	}
};

/**
 * @class PairOutcome
 * @brief Either a populated ForecastResult or the reason it could not be produced.
 */
class PairOutcome {
public:
	static PairOutcome success(ForecastResult result) {
		PairOutcome outcome;
		outcome.result_ = std::move(result);
		return outcome;
	}

	static PairOutcome failure(std::string reason) {
		PairOutcome outcome;
		outcome.error_ = std::move(reason);
		return outcome;
	}

	bool ok() const {
		return result_.has_value();
	}

	const ForecastResult &result() const {
		if (!result_) {
			throw std::logic_error("Outcome holds an error marker, not a forecast.");
		}
		return *result_;
	}

	const std::string &error() const {
		if (!error_) {
			throw std::logic_error("Outcome holds a forecast, not an error marker.");
		}
		return *error_;
	}

private:
	PairOutcome() = default;

	std::optional<ForecastResult> result_;
	std::optional<std::string> error_;
};

/// model kind -> outcome
using SeriesOutcomes = std::map<std::string, PairOutcome>;

/**
 * @struct ResultBundle
 * @brief Outcomes of one pipeline run, keyed by series then by model kind.
 *
 * Series keep the order in which they were processed.
 */
struct ResultBundle {
	std::vector<std::pair<std::string, SeriesOutcomes>> series;

	SeriesOutcomes &add(const std::string &series_key) {
		for (auto &entry : series) {
			if (entry.first == series_key) {
				return entry.second;
			}
		}
		series.emplace_back(series_key, SeriesOutcomes{});
		return series.back().second;
	}

	const SeriesOutcomes *find(const std::string &series_key) const {
		for (const auto &entry : series) {
			if (entry.first == series_key) {
				return &entry.second;
			}
		}
		return nullptr;
	}
};

} // namespace ruralcreditml::core
