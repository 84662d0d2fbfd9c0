#include "ruralcredit-ml/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ruralcreditml::utils {

namespace {

constexpr double kEpsilon = std::numeric_limits<double>::epsilon();

void require_aligned(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.empty()) {
		throw std::invalid_argument("Cannot score an empty hold-out block.");
	}
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Actual and predicted values must have the same length.");
	}
}

double sum_squared_error(const std::vector<double> &actual, const std::vector<double> &predicted) {
	double total = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double error = actual[i] - predicted[i];
		total += error * error;
	}
	return total;
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double total = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		total += std::abs(actual[i] - predicted[i]);
	}
	return total / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	return sum_squared_error(actual, predicted) / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

double Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	double total = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		total += std::abs(actual[i] - predicted[i]) / std::max(std::abs(actual[i]), kEpsilon);
	}
	return 100.0 * total / static_cast<double>(actual.size());
}

double Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	require_aligned(actual, predicted);
	const double ss_res = sum_squared_error(actual, predicted);
	const std::vector<double> baseline(actual.size(), mean(actual));
	const double ss_tot = sum_squared_error(actual, baseline);

	if (ss_tot == 0.0) {
		return ss_res == 0.0 ? 1.0 : 0.0;
	}
	return 1.0 - ss_res / ss_tot;
}

AccuracyMetrics Metrics::score(const std::vector<double> &actual, const std::vector<double> &predicted) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = mae(actual, predicted);
	metrics.rmse = rmse(actual, predicted);
	metrics.mape = mape(actual, predicted);
	metrics.r_squared = r2(actual, predicted);
	return metrics;
}

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Cannot average an empty vector.");
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double populationStdDev(const std::vector<double> &values) {
	const double centre = mean(values);
	const double spread = std::accumulate(values.begin(), values.end(), 0.0, [centre](double acc, double v) {
		return acc + (v - centre) * (v - centre);
	});
	return std::sqrt(spread / static_cast<double>(values.size()));
}

} // namespace ruralcreditml::utils
