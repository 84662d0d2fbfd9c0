#include "aggregate_reader.hpp"
#include "forecast_orchestrator.hpp"
#include "result_writer.hpp"
#include "run_config.hpp"

#include "ruralcredit-ml/core/errors.hpp"
#include "ruralcredit-ml/utils/logging.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>

namespace {

std::string timestamp() {
	const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::tm local{};
	localtime_r(&now, &local);
	std::ostringstream out;
	out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
	return out.str();
}

std::string join(const std::vector<std::string> &items) {
	std::string joined;
	for (const auto &item : items) {
		if (!joined.empty()) {
			joined += ", ";
		}
		joined += item;
	}
	return joined;
}

} // namespace

int main() {
	using ruralcreditml::utils::Logging;

	ruralcredit::RunConfig config;
	try {
		config = ruralcredit::RunConfig::fromEnvironment();
	} catch (const std::invalid_argument &e) {
		Logging::init();
		RURALCREDIT_CRITICAL("Invalid configuration: {}", e.what());
		return 2;
	}
	Logging::init(config.log_level);

	RURALCREDIT_INFO("============================================================");
	RURALCREDIT_INFO("Rural credit forecast generation started at {}", timestamp());
	RURALCREDIT_INFO("============================================================");

	try {
		ruralcredit::ForecastOrchestrator orchestrator(config);
		const auto available = orchestrator.registry().availableModels();
		RURALCREDIT_INFO("Available models: {}", available.empty() ? std::string("none") : join(available));

		const auto data = ruralcredit::AggregateReader::load(config.input_path);
		const auto bundle = orchestrator.run(data);
		ruralcredit::ResultWriter::write(bundle, config.output_path);
	} catch (const ruralcreditml::core::DataFormatError &e) {
		RURALCREDIT_CRITICAL("Invalid input data: {}", e.what());
		return 1;
	} catch (const std::exception &e) {
		RURALCREDIT_CRITICAL("Forecast generation failed: {}", e.what());
		return 1;
	}

	RURALCREDIT_INFO("============================================================");
	RURALCREDIT_INFO("Forecast generation complete.");
	RURALCREDIT_INFO("============================================================");
	return 0;
}
