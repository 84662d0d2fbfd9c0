#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace ruralcreditml::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * This class ensures that a single logger instance is used throughout the
 * application, which can be configured at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Parses a level name such as "debug" or "warn".
	 * @throws std::invalid_argument for an unknown name.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	// Private constructor to enforce singleton pattern
	Logging() = default;

	// The single logger instance
	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ruralcreditml::utils

// --- Logger Macros for convenient access ---
#define RURALCREDIT_TRACE(...)    ruralcreditml::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define RURALCREDIT_DEBUG(...)    ruralcreditml::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define RURALCREDIT_INFO(...)     ruralcreditml::utils::Logging::getLogger()->info(__VA_ARGS__)
#define RURALCREDIT_WARN(...)     ruralcreditml::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define RURALCREDIT_ERROR(...)    ruralcreditml::utils::Logging::getLogger()->error(__VA_ARGS__)
#define RURALCREDIT_CRITICAL(...) ruralcreditml::utils::Logging::getLogger()->critical(__VA_ARGS__)
