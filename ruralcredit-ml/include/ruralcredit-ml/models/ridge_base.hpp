#pragma once

#include <Eigen/Dense>
#include <vector>

namespace ruralcreditml::models {

/**
 * @class RidgeBase
 * @brief L2-regularised linear base learner underneath the tree ensembles.
 *
 * Solves (Z'Z + lambda*I) beta = Z'(y - mean(y)) on standardised features Z.
 * The intercept is the target mean and is not penalised. Constant columns are
 * excluded from the solve and receive a zero coefficient.
 *
 * Tree ensembles predict piecewise constants bounded by the training targets;
 * the linear part lets a trending series continue past that range.
 */
class RidgeBase {
public:
	explicit RidgeBase(double lambda = 1.0);

	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y);
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const;

	bool isFitted() const {
		return is_fitted_;
	}

	double intercept() const {
		return intercept_;
	}

	/// Coefficients on the original (unstandardised) feature scale.
	Eigen::VectorXd coefficients() const;

private:
	double lambda_;
	double intercept_ = 0.0;
	Eigen::VectorXd beta_;  // Coefficients on the standardised scale
	Eigen::VectorXd means_;
	Eigen::VectorXd scales_;
	std::vector<bool> active_;
	bool is_fitted_ = false;
};

} // namespace ruralcreditml::models
