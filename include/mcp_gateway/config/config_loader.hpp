#pragma once

#include <mcp_gateway/config/app_config.hpp>
#include <mcp_gateway/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_gateway {

// Environment variable that overrides catalog.directory.
constexpr const char* kServersDirEnv = "MCP_SERVERS_DIR";

// Parse a YAML config file into an AppConfig. Missing keys keep defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse the command line: subcommand, its positionals and any overrides.
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv);

// Apply environment overrides (MCP_SERVERS_DIR).
AppConfig ApplyEnvironment(AppConfig config);

// Apply CLI overrides on top of `base`.
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli);

// Split an interpreter command line on whitespace ("python3 -u").
std::vector<std::string> SplitCommandLine(std::string_view text);

// Validate ranges and combinations.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_gateway
