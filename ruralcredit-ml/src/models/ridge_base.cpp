#include "ruralcredit-ml/models/ridge_base.hpp"

#include <cmath>
#include <stdexcept>

namespace ruralcreditml::models {

namespace {

constexpr double kConstantColumnTolerance = 1e-10;

} // namespace

RidgeBase::RidgeBase(double lambda) : lambda_(lambda) {
	if (lambda_ < 0.0) {
		throw std::invalid_argument("Ridge lambda must be non-negative.");
	}
}

void RidgeBase::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	const Eigen::Index n = X.rows();
	const Eigen::Index p = X.cols();
	if (n == 0 || n != y.size()) {
		throw std::invalid_argument("Ridge base requires a non-empty design matrix aligned with the targets.");
	}

	intercept_ = y.mean();
	means_ = X.colwise().mean().transpose();
	scales_ = Eigen::VectorXd::Ones(p);
	active_.assign(static_cast<std::size_t>(p), false);

	std::vector<Eigen::Index> active_cols;
	for (Eigen::Index j = 0; j < p; ++j) {
		const double sd = std::sqrt((X.col(j).array() - means_(j)).square().mean());
		if (sd > kConstantColumnTolerance) {
			scales_(j) = sd;
			active_[static_cast<std::size_t>(j)] = true;
			active_cols.push_back(j);
		}
	}

	beta_ = Eigen::VectorXd::Zero(p);
	if (!active_cols.empty()) {
		const auto k = static_cast<Eigen::Index>(active_cols.size());
		Eigen::MatrixXd Z(n, k);
		for (Eigen::Index c = 0; c < k; ++c) {
			const Eigen::Index j = active_cols[static_cast<std::size_t>(c)];
			Z.col(c) = (X.col(j).array() - means_(j)) / scales_(j);
		}
		const Eigen::VectorXd centered = y.array() - intercept_;

		Eigen::MatrixXd ZtZ = Z.transpose() * Z;
		ZtZ.diagonal().array() += lambda_;
		Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(ZtZ);
		const Eigen::VectorXd solution = qr.solve(Z.transpose() * centered);

		for (Eigen::Index c = 0; c < k; ++c) {
			beta_(active_cols[static_cast<std::size_t>(c)]) = solution(c);
		}
	}
	is_fitted_ = true;
}

Eigen::VectorXd RidgeBase::predict(const Eigen::MatrixXd &X) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (X.cols() != means_.size()) {
		throw std::invalid_argument("Feature count does not match the fitted ridge base.");
	}
	Eigen::VectorXd out = Eigen::VectorXd::Constant(X.rows(), intercept_);
	for (Eigen::Index j = 0; j < X.cols(); ++j) {
		if (active_[static_cast<std::size_t>(j)]) {
			out.array() += beta_(j) * (X.col(j).array() - means_(j)) / scales_(j);
		}
	}
	return out;
}

Eigen::VectorXd RidgeBase::coefficients() const {
	if (!is_fitted_) {
		throw std::runtime_error("Coefficients requested before fit.");
	}
	return beta_.array() / scales_.array();
}

} // namespace ruralcreditml::models
