#include "ruralcredit-ml/features/feature_frame.hpp"

#include <algorithm>
#include <stdexcept>

namespace ruralcreditml::features {

namespace {

void validate_range(std::size_t begin, std::size_t end, std::size_t size) {
	if (begin > end || end > size) {
		throw std::out_of_range("Requested row range exceeds the feature frame.");
	}
}

} // namespace

std::size_t FeatureFrame::columnIndex(const std::string &name) const {
	const auto it = std::find(columns.begin(), columns.end(), name);
	if (it == columns.end()) {
		throw std::out_of_range("Unknown feature column: " + name);
	}
	return static_cast<std::size_t>(std::distance(columns.begin(), it));
}

Eigen::MatrixXd FeatureFrame::matrix(std::size_t begin, std::size_t end) const {
	validate_range(begin, end, rows.size());
	Eigen::MatrixXd X(static_cast<Eigen::Index>(end - begin), static_cast<Eigen::Index>(columns.size()));
	for (std::size_t i = begin; i < end; ++i) {
		const auto &values = rows[i].values;
		if (values.size() != columns.size()) {
			throw std::logic_error("Feature row width does not match the column count.");
		}
		for (std::size_t j = 0; j < values.size(); ++j) {
			X(static_cast<Eigen::Index>(i - begin), static_cast<Eigen::Index>(j)) = values[j];
		}
	}
	return X;
}

Eigen::VectorXd FeatureFrame::targets(std::size_t begin, std::size_t end) const {
	validate_range(begin, end, rows.size());
	Eigen::VectorXd y(static_cast<Eigen::Index>(end - begin));
	for (std::size_t i = begin; i < end; ++i) {
		y(static_cast<Eigen::Index>(i - begin)) = rows[i].target;
	}
	return y;
}

std::vector<double> FeatureFrame::trailingTargets(std::size_t count) const {
	const std::size_t take = std::min(count, rows.size());
	std::vector<double> tail;
	tail.reserve(take);
	for (std::size_t i = rows.size() - take; i < rows.size(); ++i) {
		tail.push_back(rows[i].target);
	}
	return tail;
}

} // namespace ruralcreditml::features
