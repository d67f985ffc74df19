#pragma once

#include <querygraph/config/app_config.hpp>
#include <querygraph/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace querygraph {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse the global CLI flags (everything before the command group) into an
// AppConfig. `config_path` receives the value of -c/--config when given.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::string* config_path = nullptr);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields left at their defaults in cli_overrides keep the yaml_base value.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Parse "ALIAS=NAME" linked-server entries.
Result<LinkedServerMap, Error> ParseLinkedServers(const std::vector<std::string>& entries);

// Validate that values are sane: debounce within 400..800 ms, not both
// verbose and quiet, non-empty linked-server aliases and names.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace querygraph
