#include "result_writer.hpp"

#include "ruralcredit-ml/utils/logging.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace ruralcredit {

namespace fs = std::filesystem;

namespace {

nlohmann::json number_or_null(double value) {
	if (!std::isfinite(value)) {
		return nullptr;
	}
	return value;
}

} // namespace

nlohmann::json ResultWriter::toJson(const ruralcreditml::utils::AccuracyMetrics &metrics) {
	return nlohmann::json{{"mape", number_or_null(metrics.mape)},
	                      {"rmse", number_or_null(metrics.rmse)},
	                      {"r2", number_or_null(metrics.r_squared)}};
}

nlohmann::json ResultWriter::toJson(const ruralcreditml::core::PairOutcome &outcome) {
	if (!outcome.ok()) {
		return nlohmann::json{{"error", outcome.error()}};
	}

	const auto &result = outcome.result();
	auto predictions = nlohmann::json::array();
	for (const auto &point : result.points) {
		predictions.push_back(nlohmann::json{{"year", point.period.year},
		                       {"month", point.period.month},
		                       {"value", point.value},
		                       {"lower_80", point.lower_80},
		                       {"upper_80", point.upper_80},
		                       {"lower_95", point.lower_95},
		                       {"upper_95", point.upper_95}});
	}

	auto metrics = toJson(result.metrics);
	nlohmann::json entry;
	entry["predictions"] = std::move(predictions);
	entry["mape"] = metrics["mape"];
	entry["rmse"] = metrics["rmse"];
	entry["r2"] = metrics["r2"];
	entry["metrics"] = std::move(metrics);
	return entry;
}

nlohmann::json ResultWriter::toJson(const ruralcreditml::core::ResultBundle &bundle) {
	auto document = nlohmann::json::object();
	for (const auto &series : bundle.series) {
		auto models = nlohmann::json::object();
		for (const auto &model : series.second) {
			models[model.first] = toJson(model.second);
		}
		document[series.first] = std::move(models);
	}
	return document;
}

std::uintmax_t ResultWriter::write(const ruralcreditml::core::ResultBundle &bundle, const std::string &path) {
	const fs::path target(path);
	if (target.has_parent_path()) {
		fs::create_directories(target.parent_path());
	}

	{
		std::ofstream output(target);
		if (!output) {
			throw std::runtime_error("Cannot open " + path + " for writing.");
		}
		output << toJson(bundle).dump(2) << '\n';
		if (!output) {
			throw std::runtime_error("Failed writing " + path + ".");
		}
	}

	const auto size = fs::file_size(target);
	RURALCREDIT_INFO("Forecasts saved to {} ({:.1f} KB).", path, static_cast<double>(size) / 1024.0);
	return size;
}

} // namespace ruralcredit
