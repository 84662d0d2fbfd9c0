#include <catch2/catch_test_macros.hpp>

#include "run_config.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using ruralcredit::RunConfig;

namespace {

RunConfig::EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> variables) {
	return [variables](const std::string &name) -> std::optional<std::string> {
		const auto it = variables.find(name);
		if (it == variables.end()) {
			return std::nullopt;
		}
		return it->second;
	};
}

} // namespace

TEST_CASE("Run config defaults", "[app][config]") {
	const auto config = RunConfig::fromEnvironment(fakeEnvironment({}));
	REQUIRE(config.series == std::vector<std::string>{"total", "custeio", "investimento", "comercializacao"});
	REQUIRE(config.models == std::vector<std::string>{"xgboost", "lightgbm", "randomforest"});
	REQUIRE(config.input_path == "dashboard/public/data/aggregated.json");
	REQUIRE(config.output_path == "dashboard/public/data/forecasts.json");
	REQUIRE(config.log_level == spdlog::level::info);
	REQUIRE(config.disabled_models.empty());
	REQUIRE(config.pipeline.horizon == 24);
	REQUIRE(config.categories() == std::vector<std::string>{"custeio", "investimento", "comercializacao"});
}

TEST_CASE("Run config reads the environment", "[app][config]") {
	const auto config = RunConfig::fromEnvironment(fakeEnvironment({{"RURALCREDIT_INPUT", "/data/in.json"},
	                                                                 {"RURALCREDIT_OUTPUT", " /data/out.json "},
	                                                                 {"RURALCREDIT_LOG_LEVEL", "debug"},
	                                                                 {"RURALCREDIT_DISABLED_MODELS", "lightgbm, ,xgboost"}}));
	REQUIRE(config.input_path == "/data/in.json");
	REQUIRE(config.output_path == "/data/out.json");
	REQUIRE(config.log_level == spdlog::level::debug);
	REQUIRE(config.disabled_models == std::vector<std::string>{"lightgbm", "xgboost"});

	SECTION("blank values keep defaults") {
		const auto blank = RunConfig::fromEnvironment(fakeEnvironment({{"RURALCREDIT_INPUT", "  "}}));
		REQUIRE(blank.input_path == "dashboard/public/data/aggregated.json");
	}

	SECTION("unknown log level") {
		REQUIRE_THROWS_AS(RunConfig::fromEnvironment(fakeEnvironment({{"RURALCREDIT_LOG_LEVEL", "loud"}})),
		                  std::invalid_argument);
	}
}

TEST_CASE("List splitting trims and drops blanks", "[app][config]") {
	REQUIRE(ruralcredit::splitList("a,b") == std::vector<std::string>{"a", "b"});
	REQUIRE(ruralcredit::splitList(" a , ,b,") == std::vector<std::string>{"a", "b"});
	REQUIRE(ruralcredit::splitList("").empty());
}
