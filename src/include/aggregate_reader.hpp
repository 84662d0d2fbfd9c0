#pragma once

#include "aggregate_data.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace ruralcredit {

/**
 * @class AggregateReader
 * @brief Loads the aggregated-series artifact produced by the ETL step.
 *
 * Structural violations (root not an object, neither total view present, a view that
 * is not an array of objects, a record without a numeric year or month) raise
 * ruralcreditml::core::DataFormatError. Value-like fields are coerced: numbers and
 * numeric strings are kept, anything else becomes 0.
 */
class AggregateReader {
public:
	/// Reads and parses a file; a missing or unparsable file is a DataFormatError.
	static AggregateData load(const std::string &path);

	static AggregateData parse(const nlohmann::json &document);

	/// Numeric coercion used for value-like fields.
	static double coerceNumber(const nlohmann::json &field);
};

} // namespace ruralcredit
