#pragma once

#include <svn_bridge/config/app_config.hpp>
#include <svn_bridge/core/result.hpp>

#include <string_view>

namespace svn_bridge {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line flags (argv without the command name) into an
// AppConfig. Positional arguments become command.targets.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Fill execution.password / execution.proxy.password from the named
// environment variables when they were not given inline.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config);

// Validate that values are sane before anything is spawned.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Parse "always"/"never"/"auto" (or a YAML/CLI boolean) into the color
// tri-state. nullopt for anything else.
std::optional<int> ParseColorMode(std::string_view value);

} // namespace svn_bridge
