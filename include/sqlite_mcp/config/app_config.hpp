#pragma once

#include <optional>
#include <string>

namespace sqlite_mcp {

struct DatabaseConfig {
    std::string path = "data/logistics.db";
    int max_attempts = 3;
    int retry_delay_ms = 500;
    int busy_timeout_ms = 10000;
    bool create_if_missing = false;
};

struct SlackConfig {
    std::string api_base_url = "https://slack.com";
    std::string token_env = "SLACK_BOT_TOKEN";  // env var holding the bot token
    int timeout_seconds = 10;
    int default_thread_limit = 10;
};

struct AppConfig {
    DatabaseConfig database;
    SlackConfig slack;
    std::optional<std::string> log_file;
    std::string log_level = "info";
    bool json_log = false;
};

// Values given on the command line. Unset fields leave the YAML (or
// default) value in place.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> db_path;
    std::optional<std::string> log_file;
    std::optional<std::string> slack_api_url;
    bool json_log = false;
    bool verbose = false;
};

} // namespace sqlite_mcp
