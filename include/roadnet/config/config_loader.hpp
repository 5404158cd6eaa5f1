#pragma once

#include <roadnet/config/app_config.hpp>
#include <roadnet/core/result.hpp>

#include <string>
#include <string_view>

namespace roadnet {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text (same keys as LoadFromYaml).
Result<AppConfig, Error> LoadFromYamlString(std::string_view text);

// Parse `build` arguments into an AppConfig. argv[0] is the program name;
// the subcommand itself must already be stripped.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace roadnet
