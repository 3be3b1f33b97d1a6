#pragma once

#include <mcp_guard/config/app_config.hpp>
#include <mcp_guard/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_guard {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text into an AppConfig. Absent keys keep their defaults.
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml);

// Parse CLI arguments into an AppConfig. Only server and logging fields
// (plus the config file path) can be set from the command line.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields left at their defaults in cli_overrides do not override.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are sane: positive windows and limits, thresholds
// in (0, 100], non-increasing throttle multipliers, non-zero port.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_guard
