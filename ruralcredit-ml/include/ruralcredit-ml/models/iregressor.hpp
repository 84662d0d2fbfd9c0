#pragma once

#include <Eigen/Dense>
#include <string>

namespace ruralcreditml::models {

/**
 * @class IRegressor
 * @brief An interface for all regression models trained on feature matrices.
 *
 * A regressor is created, fitted once and then used for any number of
 * predictions. Instances are not shared between series or threads.
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * @brief Fits the model to a design matrix and its targets.
	 * @param X Feature matrix, one row per observation.
	 * @param y Target values aligned with the rows of @p X.
	 */
	virtual void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) = 0;

	/**
	 * @brief Predicts one value per row of @p X.
	 * @throws std::runtime_error if called before fit.
	 */
	virtual Eigen::VectorXd predict(const Eigen::MatrixXd &X) const = 0;

	/**
	 * @brief Gets the registry name of the model (e.g., "xgboost").
	 */
	virtual std::string getName() const = 0;
};

} // namespace ruralcreditml::models
