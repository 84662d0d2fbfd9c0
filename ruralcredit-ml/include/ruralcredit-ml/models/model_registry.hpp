#pragma once

#include "ruralcredit-ml/core/pipeline_config.hpp"
#include "ruralcredit-ml/models/iregressor.hpp"

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ruralcreditml::models {

using RegressorFactory = std::function<std::unique_ptr<IRegressor>(const core::PipelineConfig &)>;

/**
 * @class ModelRegistry
 * @brief Maps model kind names to factories and tracks which kinds are available.
 *
 * A disabled or unknown kind is a valid runtime configuration: create() reports it
 * with core::ModelUnavailableError instead of failing the run.
 */
class ModelRegistry {
public:
	/// Registry holding the built-in "xgboost", "lightgbm" and "randomforest" kinds.
	static ModelRegistry withDefaults();

	/// Registers (or replaces) a factory; kinds keep their first registration order.
	void registerModel(const std::string &name, RegressorFactory factory);

	/// Marks a kind unavailable for this run.
	void disable(const std::string &name);

	bool isRegistered(const std::string &name) const;
	bool isAvailable(const std::string &name) const;

	/// Available kinds in registration order.
	std::vector<std::string> availableModels() const;

	/**
	 * @brief Creates a fresh, unfitted model of the given kind.
	 * @throws core::ModelUnavailableError if the kind is unknown or disabled.
	 */
	std::unique_ptr<IRegressor> create(const std::string &name, const core::PipelineConfig &config) const;

private:
	std::vector<std::pair<std::string, RegressorFactory>> factories_;
	std::set<std::string> disabled_;
};

} // namespace ruralcreditml::models
