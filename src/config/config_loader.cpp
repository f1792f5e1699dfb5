#include <sqlite_mcp/config/config_loader.hpp>

#include <sqlite_mcp/core/log.hpp>
#include <sqlite_mcp/core/version.hpp>
#include <sqlite_mcp/slack/messaging.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>

namespace sqlite_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

// Copy `node[key]` into `out` when present. Conversion failures surface as
// YAML::Exception and are reported by the caller.
template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Database --
        if (const auto db = root["database"]) {
            ReadScalar(db, "path", config.database.path);
            ReadScalar(db, "max_attempts", config.database.max_attempts);
            ReadScalar(db, "retry_delay_ms", config.database.retry_delay_ms);
            ReadScalar(db, "busy_timeout_ms", config.database.busy_timeout_ms);
            ReadScalar(db, "create_if_missing", config.database.create_if_missing);
        }

        // -- Slack --
        if (const auto slack = root["slack"]) {
            ReadScalar(slack, "api_base_url", config.slack.api_base_url);
            ReadScalar(slack, "token_env", config.slack.token_env);
            ReadScalar(slack, "timeout_seconds", config.slack.timeout_seconds);
            ReadScalar(slack, "default_thread_limit",
                       config.slack.default_thread_limit);
        }

        // -- Logging --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        ReadScalar(root, "log_level", config.log_level);
        ReadScalar(root, "json_log", config.json_log);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion);
    program.add_description(
        "MCP server exposing a SQLite database and Slack threads as tools "
        "over line-delimited JSON-RPC on stdin/stdout.");

    program.add_argument("--db")
        .help("Path to the SQLite database file");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--slack-api-url")
        .help("Base URL of the Slack Web API");
    program.add_argument("--log-file")
        .help("Also append diagnostics to this file");
    program.add_argument("--json-log")
        .help("Write diagnostics as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Debug-level diagnostics")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.db_path = program.present("--db");
    cli.slack_api_url = program.present("--slack-api-url");
    cli.log_file = program.present("--log-file");
    cli.json_log = program.get<bool>("--json-log");
    cli.verbose = program.get<bool>("--verbose");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.db_path) {
        merged.database.path = *cli.db_path;
    }
    if (cli.slack_api_url) {
        merged.slack.api_base_url = *cli.slack_api_url;
    }
    if (cli.log_file) {
        merged.log_file = cli.log_file;
    }
    if (cli.json_log) {
        merged.json_log = true;
    }
    if (cli.verbose) {
        merged.log_level = "debug";
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    using R = Result<void, Error>;

    const auto& db = config.database;
    if (db.path.empty()) {
        return R::Err(MakeConfigError("Missing required field: database.path"));
    }
    if (db.max_attempts < 1) {
        return R::Err(MakeConfigError("database.max_attempts must be at least 1"));
    }
    if (db.retry_delay_ms < 0) {
        return R::Err(MakeConfigError("database.retry_delay_ms must not be negative"));
    }
    if (db.busy_timeout_ms < 0) {
        return R::Err(MakeConfigError("database.busy_timeout_ms must not be negative"));
    }

    const auto& slack = config.slack;
    if (slack.api_base_url.empty()) {
        return R::Err(MakeConfigError("Missing required field: slack.api_base_url"));
    }
    if (slack.token_env.empty()) {
        return R::Err(MakeConfigError("Missing required field: slack.token_env"));
    }
    if (slack.timeout_seconds < 0) {
        return R::Err(MakeConfigError("slack.timeout_seconds must not be negative"));
    }
    if (slack.default_thread_limit < 1 || slack.default_thread_limit > kMaxThreadLimit) {
        return R::Err(MakeConfigError("slack.default_thread_limit must be between 1 and " +
                                      std::to_string(kMaxThreadLimit)));
    }

    LogLevel level;
    if (!ParseLogLevel(config.log_level, level)) {
        return R::Err(MakeConfigError("Unknown log_level: " + config.log_level));
    }

    return R::Ok();
}

ConnectionOptions ToConnectionOptions(const DatabaseConfig& config) {
    ConnectionOptions options;
    options.path = config.path;
    options.max_attempts = config.max_attempts;
    options.retry_delay = std::chrono::milliseconds(config.retry_delay_ms);
    options.busy_timeout = std::chrono::milliseconds(config.busy_timeout_ms);
    options.create_if_missing = config.create_if_missing;
    return options;
}

} // namespace sqlite_mcp
