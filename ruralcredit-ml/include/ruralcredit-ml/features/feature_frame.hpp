#pragma once

#include "ruralcredit-ml/core/observation.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace ruralcreditml::features {

/**
 * @struct FeatureRow
 * @brief Feature vector derived from one observation.
 *
 * Every entry of @c values is defined; rows with missing look-back data are never built.
 */
struct FeatureRow {
	core::Period period;
	std::size_t trend = 0; ///< Position of the source observation in the original sequence
	double target = 0.0;
	std::vector<double> values;
};

/**
 * @struct FeatureFrame
 * @brief Usable feature rows of one series, in temporal order.
 */
struct FeatureFrame {
	std::vector<std::string> columns;
	std::vector<FeatureRow> rows;
	std::size_t source_length = 0; ///< Length of the observation sequence before rows were dropped

	std::size_t size() const {
		return rows.size();
	}

	bool empty() const {
		return rows.empty();
	}

	/// Index of a named column; throws std::out_of_range when absent.
	std::size_t columnIndex(const std::string &name) const;

	/// Design matrix of rows [begin, end).
	Eigen::MatrixXd matrix(std::size_t begin, std::size_t end) const;

	/// Target vector of rows [begin, end).
	Eigen::VectorXd targets(std::size_t begin, std::size_t end) const;

	/// The last @p count targets (fewer when the frame is shorter), oldest first.
	std::vector<double> trailingTargets(std::size_t count) const;
};

} // namespace ruralcreditml::features
