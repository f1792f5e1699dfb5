#include <sqlite_mcp/config/config_loader.hpp>
#include <sqlite_mcp/core/log.hpp>
#include <sqlite_mcp/core/terminal.hpp>
#include <sqlite_mcp/core/version.hpp>
#include <sqlite_mcp/db/connection_provider.hpp>
#include <sqlite_mcp/mcp/mcp_server.hpp>
#include <sqlite_mcp/mcp/mcp_tool_handlers.hpp>
#include <sqlite_mcp/slack/credentials.hpp>
#include <sqlite_mcp/slack/slack_session.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitInternal = 99;

void PrintError(const sqlite_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Console sink on stderr, optionally tee'd into a log file.
std::unique_ptr<sqlite_mcp::ILogSink> MakeSink(const sqlite_mcp::AppConfig& config) {
    using namespace sqlite_mcp;

    std::unique_ptr<ILogSink> console;
    if (config.json_log) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        const bool use_color = !NoColorEnvSet() && IsStderrTty();
        console = std::make_unique<ColorConsoleSink>(use_color);
    }

    if (!config.log_file) {
        return console;
    }
    auto file = std::make_unique<FileSink>(*config.log_file, config.json_log);
    if (!file->IsOpen()) {
        std::cerr << "Warning: cannot open log file " << *config.log_file << "\n";
        return console;
    }
    return std::make_unique<TeeSink>(std::move(console), std::move(file));
}

int RunServer(const sqlite_mcp::AppConfig& config) {
    using namespace sqlite_mcp;

    std::error_code ec;
    if (!std::filesystem::exists(config.database.path, ec)) {
        LogWarn("main", "Database file not found: " + config.database.path +
                            " (tool calls will fail until it exists)");
    }
    if (IsStdinTty()) {
        LogInfo("main", "Reading JSON-RPC requests from a terminal, one per line");
    }

    ConnectionProvider provider(ToConnectionOptions(config.database));

    SlackSessionOptions session_opts;
    session_opts.connect_timeout = std::chrono::seconds(config.slack.timeout_seconds);
    session_opts.read_timeout = std::chrono::seconds(config.slack.timeout_seconds);
    SlackSession session(config.slack.api_base_url, session_opts);

    SlackToolOptions slack_opts;
    slack_opts.credentials = EnvCredential(config.slack.token_env);
    slack_opts.token_name = config.slack.token_env;
    slack_opts.default_thread_limit = config.slack.default_thread_limit;

    ToolRegistry registry;
    RegisterDatabaseTools(registry, provider);
    RegisterSlackTools(registry, session, std::move(slack_opts));

    LogInfo("main", std::string(kServerName) + " " + kVersion + " serving " +
                        config.database.path);

    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace sqlite_mcp;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    const auto cli = std::move(cli_result).Value();

    AppConfig base;
    if (cli.config_path) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        base = std::move(yaml_result).Value();
    }

    const auto config = MergeConfigs(base, cli);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    LogLevel level = LogLevel::Info;
    if (!ParseLogLevel(config.log_level, level)) {
        level = LogLevel::Info;
    }
    InitGlobalLogger(MakeSink(config), level);

    try {
        return RunServer(config);
    } catch (const std::exception& e) {
        LogError("main", std::string("Fatal: ") + e.what());
        return kExitInternal;
    }
}
