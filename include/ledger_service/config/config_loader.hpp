#pragma once

#include <ledger_service/config/app_config.hpp>
#include <ledger_service/core/result.hpp>

#include <string_view>

namespace ledger_service {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line arguments into an AppConfig. Only flags that were given
// differ from the AppConfig defaults; -c/--config lands in config_file.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// If base_path is empty and base_path_env names a set variable, copy its value.
Result<AppConfig, Error> ResolveBasePathEnv(AppConfig config);

// Check that everything needed to serve requests is present.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Full startup sequence: CLI, optional YAML, merge, env, validate.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv);

} // namespace ledger_service
