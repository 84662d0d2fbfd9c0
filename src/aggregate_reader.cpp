#include "aggregate_reader.hpp"

#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace ruralcredit {

using ruralcreditml::core::DataFormatError;

namespace {

std::optional<double> parse_numeric(const nlohmann::json &field) {
	if (field.is_number()) {
		const double value = field.get<double>();
		if (std::isfinite(value)) {
			return value;
		}
		return std::nullopt;
	}
	if (field.is_string()) {
		const auto &text = field.get_ref<const std::string &>();
		if (text.empty()) {
			return std::nullopt;
		}
		errno = 0;
		char *end = nullptr;
		const double value = std::strtod(text.c_str(), &end);
		if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
			return std::nullopt;
		}
		return value;
	}
	return std::nullopt;
}

int required_integer(const nlohmann::json &record, const char *key, const std::string &view, std::size_t index) {
	const auto it = record.find(key);
	std::optional<double> value;
	if (it != record.end()) {
		value = parse_numeric(*it);
	}
	if (!value || std::floor(*value) != *value) {
		throw DataFormatError("Record " + std::to_string(index) + " of '" + view + "' has no integral '" + key +
		                      "' field.");
	}
	if (*value < static_cast<double>(std::numeric_limits<int>::min()) ||
	    *value > static_cast<double>(std::numeric_limits<int>::max())) {
		throw DataFormatError("Record " + std::to_string(index) + " of '" + view + "' has '" + key +
		                      "' out of range.");
	}
	return static_cast<int>(*value);
}

std::optional<double> optional_number(const nlohmann::json &record, const char *key) {
	const auto it = record.find(key);
	if (it == record.end()) {
		return std::nullopt;
	}
	return AggregateReader::coerceNumber(*it);
}

std::vector<AggregateRecord> parse_view(const nlohmann::json &document, const std::string &view, bool monthly,
                                        bool categorized) {
	std::vector<AggregateRecord> records;
	const auto it = document.find(view);
	if (it == document.end() || it->is_null()) {
		return records;
	}
	if (!it->is_array()) {
		throw DataFormatError("View '" + view + "' must be an array of records.");
	}

	records.reserve(it->size());
	std::size_t index = 0;
	for (const auto &entry : *it) {
		if (!entry.is_object()) {
			throw DataFormatError("Record " + std::to_string(index) + " of '" + view + "' is not an object.");
		}
		AggregateRecord record;
		record.year = required_integer(entry, "ano", view, index);
		if (monthly) {
			const int month = required_integer(entry, "mes", view, index);
			if (month < 1 || month > 12) {
				throw DataFormatError("Record " + std::to_string(index) + " of '" + view +
				                      "' has a month outside 1..12.");
			}
			record.month = month;
		}
		const auto value = entry.find("valor");
		record.value = value != entry.end() ? AggregateReader::coerceNumber(*value) : 0.0;
		record.contracts = optional_number(entry, "contratos");
		record.area = optional_number(entry, "area");
		if (categorized) {
			const auto category = entry.find("finalidade");
			if (category != entry.end() && category->is_string()) {
				record.category = category->get<std::string>();
			}
		}
		records.push_back(std::move(record));
		++index;
	}
	return records;
}

} // namespace

double AggregateReader::coerceNumber(const nlohmann::json &field) {
	return parse_numeric(field).value_or(0.0);
}

AggregateData AggregateReader::parse(const nlohmann::json &document) {
	if (!document.is_object()) {
		throw DataFormatError("Aggregated data must be a JSON object.");
	}
	if (!document.contains("byMes") && !document.contains("byAno")) {
		throw DataFormatError("Aggregated data has neither a 'byMes' nor a 'byAno' view.");
	}

	AggregateData data;
	data.by_month = parse_view(document, "byMes", true, false);
	data.by_year = parse_view(document, "byAno", false, false);
	data.by_category_month = parse_view(document, "byFinalidadeMes", true, true);
	data.by_category_year = parse_view(document, "byFinalidade", false, true);
	return data;
}

AggregateData AggregateReader::load(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw DataFormatError("aggregated data not found at " + path);
	}

	nlohmann::json document;
	try {
		input >> document;
	} catch (const nlohmann::json::parse_error &e) {
		throw DataFormatError("Cannot parse " + path + ": " + e.what());
	}

	auto data = parse(document);
	RURALCREDIT_INFO("Loaded {} ({} monthly, {} annual, {} monthly by category, {} annual by category records).",
	                 path, data.by_month.size(), data.by_year.size(), data.by_category_month.size(),
	                 data.by_category_year.size());
	return data;
}

} // namespace ruralcredit
