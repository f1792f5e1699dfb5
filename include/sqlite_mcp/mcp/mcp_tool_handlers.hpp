#pragma once

#include <sqlite_mcp/db/connection_provider.hpp>
#include <sqlite_mcp/db/queries.hpp>
#include <sqlite_mcp/mcp/tool_registry.hpp>
#include <sqlite_mcp/slack/credentials.hpp>
#include <sqlite_mcp/slack/i_slack_session.hpp>

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace sqlite_mcp {

// Rows shown by read_query; the full count is still reported.
constexpr std::size_t kMaxDisplayRows = 100;

// Register list_tables, describe_table, read_query and write_query.
// Every call acquires its own connection from `provider` and releases it
// before returning. Store failures are thrown as ToolExecutionError.
// The provider must outlive the registry.
void RegisterDatabaseTools(ToolRegistry& registry,
                           const ConnectionProvider& provider);

struct SlackToolOptions {
    CredentialSource credentials;
    // Name reported when no credential is available.
    std::string token_name = "SLACK_BOT_TOKEN";
    int default_thread_limit = 10;
};

// Register read_thread and send_message. Handlers never throw: every
// failure comes back as {"success": false, "error": ...}.
// The session is captured by reference and must outlive the registry.
void RegisterSlackTools(ToolRegistry& registry, ISlackSession& session,
                        SlackToolOptions options);

// JSON rendering of one store cell. Blobs become lower-case hex text.
[[nodiscard]] nlohmann::json ValueToJson(const Value& value);

// read_query payload: columns, at most kMaxDisplayRows rows, row_count and
// omitted_rows when rows were cut.
[[nodiscard]] nlohmann::json QueryResultToJson(const QueryResult& result);

} // namespace sqlite_mcp
