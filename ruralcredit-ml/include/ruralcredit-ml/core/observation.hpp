#pragma once

#include <optional>
#include <tuple>
#include <vector>

namespace ruralcreditml::core {

/**
 * @struct Period
 * @brief A calendar month. Annual data uses a fixed placeholder month.
 */
struct Period {
	int year = 0;
	int month = 1;

	/// Returns the following month, carrying into the next year after December.
	Period next() const {
		if (month >= 12) {
			return Period{year + 1, 1};
		}
		return Period{year, month + 1};
	}

	/// Returns the period @p steps months ahead.
	Period advance(int steps) const {
		const int zero_based = month - 1 + steps;
		return Period{year + zero_based / 12, zero_based % 12 + 1};
	}

	bool operator<(const Period &other) const {
		return std::tie(year, month) < std::tie(other.year, other.month);
	}

	bool operator==(const Period &other) const {
		return year == other.year && month == other.month;
	}

	bool operator!=(const Period &other) const {
		return !(*this == other);
	}
};

/**
 * @struct Observation
 * @brief One value of a series at a given period.
 */
struct Observation {
	Period period;
	double value = 0.0;
	std::optional<double> contracts;
	std::optional<double> area;
};

/// Observations ordered strictly by period; missing periods are simply absent.
using ObservationSeries = std::vector<Observation>;

} // namespace ruralcreditml::core
