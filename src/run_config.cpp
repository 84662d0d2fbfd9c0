#include "run_config.hpp"

#include "ruralcredit-ml/utils/logging.hpp"

#include <cctype>
#include <cstdlib>

namespace ruralcredit {

namespace {

std::string trim(const std::string &text) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		--end;
	}
	return text.substr(begin, end - begin);
}

std::optional<std::string> non_empty(const RunConfig::EnvironmentLookup &lookup, const std::string &name) {
	auto value = lookup(name);
	if (!value) {
		return std::nullopt;
	}
	auto trimmed = trim(*value);
	if (trimmed.empty()) {
		return std::nullopt;
	}
	return trimmed;
}

} // namespace

std::vector<std::string> splitList(const std::string &text) {
	std::vector<std::string> items;
	std::size_t start = 0;
	while (start <= text.size()) {
		auto comma = text.find(',', start);
		if (comma == std::string::npos) {
			comma = text.size();
		}
		auto item = trim(text.substr(start, comma - start));
		if (!item.empty()) {
			items.push_back(std::move(item));
		}
		start = comma + 1;
	}
	return items;
}

std::vector<std::string> RunConfig::categories() const {
	std::vector<std::string> keys;
	for (const auto &key : series) {
		if (key != "total") {
			keys.push_back(key);
		}
	}
	return keys;
}

RunConfig RunConfig::fromEnvironment() {
	return fromEnvironment([](const std::string &name) -> std::optional<std::string> {
		const char *value = std::getenv(name.c_str());
		if (value == nullptr) {
			return std::nullopt;
		}
		return std::string(value);
	});
}

RunConfig RunConfig::fromEnvironment(const EnvironmentLookup &lookup) {
	RunConfig config;
	if (auto input = non_empty(lookup, "RURALCREDIT_INPUT")) {
		config.input_path = *input;
	}
	if (auto output = non_empty(lookup, "RURALCREDIT_OUTPUT")) {
		config.output_path = *output;
	}
	if (auto level = non_empty(lookup, "RURALCREDIT_LOG_LEVEL")) {
		config.log_level = ruralcreditml::utils::Logging::parseLevel(*level);
	}
	if (auto disabled = non_empty(lookup, "RURALCREDIT_DISABLED_MODELS")) {
		config.disabled_models = splitList(*disabled);
	}
	return config;
}

} // namespace ruralcredit
