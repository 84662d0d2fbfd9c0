#include "ruralcredit-ml/models/model_registry.hpp"

#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/models/gradient_boosting.hpp"
#include "ruralcredit-ml/models/histogram_boosting.hpp"
#include "ruralcredit-ml/models/random_forest.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <algorithm>

namespace ruralcreditml::models {

ModelRegistry ModelRegistry::withDefaults() {
	ModelRegistry registry;
	// Fixed configurations tuned for stability on short monthly series.
	registry.registerModel("xgboost", [](const core::PipelineConfig &config) -> std::unique_ptr<IRegressor> {
		return GradientBoostedTreesBuilder()
		    .withEstimators(100)
		    .withMaxDepth(4)
		    .withLearningRate(0.1)
		    .withSeed(config.seed)
		    .build();
	});
	registry.registerModel("lightgbm", [](const core::PipelineConfig &config) -> std::unique_ptr<IRegressor> {
		return HistogramBoostedTreesBuilder()
		    .withEstimators(100)
		    .withMaxDepth(4)
		    .withNumLeaves(31)
		    .withLearningRate(0.1)
		    .withSeed(config.seed)
		    .build();
	});
	registry.registerModel("randomforest", [](const core::PipelineConfig &config) -> std::unique_ptr<IRegressor> {
		return RandomForestBuilder().withEstimators(100).withMaxDepth(6).withSeed(config.seed).build();
	});
	return registry;
}

void ModelRegistry::registerModel(const std::string &name, RegressorFactory factory) {
	if (name.empty()) {
		throw std::invalid_argument("Model name must not be empty.");
	}
	if (!factory) {
		throw std::invalid_argument("Model factory must be callable.");
	}
	for (auto &entry : factories_) {
		if (entry.first == name) {
			entry.second = std::move(factory);
			return;
		}
	}
	factories_.emplace_back(name, std::move(factory));
}

void ModelRegistry::disable(const std::string &name) {
	disabled_.insert(name);
	RURALCREDIT_WARN("Model '{}' disabled for this run.", name);
}

bool ModelRegistry::isRegistered(const std::string &name) const {
	return std::any_of(factories_.begin(), factories_.end(),
	                   [&](const auto &entry) { return entry.first == name; });
}

bool ModelRegistry::isAvailable(const std::string &name) const {
	return isRegistered(name) && disabled_.count(name) == 0;
}

std::vector<std::string> ModelRegistry::availableModels() const {
	std::vector<std::string> names;
	for (const auto &entry : factories_) {
		if (disabled_.count(entry.first) == 0) {
			names.push_back(entry.first);
		}
	}
	return names;
}

std::unique_ptr<IRegressor> ModelRegistry::create(const std::string &name, const core::PipelineConfig &config) const {
	if (disabled_.count(name) != 0) {
		throw core::ModelUnavailableError(name);
	}
	for (const auto &entry : factories_) {
		if (entry.first == name) {
			return entry.second(config);
		}
	}
	throw core::ModelUnavailableError(name);
}

} // namespace ruralcreditml::models
