#pragma once

#include <sqlite_mcp/config/app_config.hpp>
#include <sqlite_mcp/core/result.hpp>
#include <sqlite_mcp/db/connection_provider.hpp>

#include <string_view>

namespace sqlite_mcp {

// Parse a YAML config file into an AppConfig. Keys absent from the file
// keep their defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply command-line values on top of a file (or default) config.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Connection provider settings for a validated config.
ConnectionOptions ToConnectionOptions(const DatabaseConfig& config);

} // namespace sqlite_mcp
