#pragma once

#include <stdexcept>
#include <string>

namespace ruralcreditml::core {

/**
 * @brief Raised when a series is too short to featurize, split or fit.
 *
 * Recovered per series/model pair and reported as an error marker.
 */
class InsufficientDataError : public std::runtime_error {
public:
	explicit InsufficientDataError(const std::string &message) : std::runtime_error(message) {
	}
};

/**
 * @brief Raised when a model kind is not available in the current run.
 */
class ModelUnavailableError : public std::runtime_error {
public:
	explicit ModelUnavailableError(const std::string &model_name)
	    : std::runtime_error(model_name + " not available"), model_name_(model_name) {
	}

	const std::string &modelName() const {
		return model_name_;
	}

private:
	std::string model_name_;
};

/**
 * @brief Raised when the aggregated input violates its structural contract.
 *
 * Never recovered locally: without a well-formed base dataset there is no bundle to produce.
 */
class DataFormatError : public std::runtime_error {
public:
	explicit DataFormatError(const std::string &message) : std::runtime_error(message) {
	}
};

} // namespace ruralcreditml::core
