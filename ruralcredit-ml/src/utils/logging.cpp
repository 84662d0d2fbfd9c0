#include "ruralcredit-ml/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace ruralcreditml::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("ruralcredit");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("ruralcredit");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	if (name == "trace") {
		return spdlog::level::trace;
	}
	if (name == "debug") {
		return spdlog::level::debug;
	}
	if (name == "info") {
		return spdlog::level::info;
	}
	if (name == "warn" || name == "warning") {
		return spdlog::level::warn;
	}
	if (name == "error") {
		return spdlog::level::err;
	}
	if (name == "critical") {
		return spdlog::level::critical;
	}
	if (name == "off") {
		return spdlog::level::off;
	}
	throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace ruralcreditml::utils
