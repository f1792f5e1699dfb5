#include <sqlite_mcp/mcp/mcp_tool_handlers.hpp>

#include <sqlite_mcp/core/log.hpp>
#include <sqlite_mcp/slack/messaging.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sqlite_mcp {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

// Store text is not guaranteed to be valid UTF-8; replace bad sequences
// rather than failing the dump.
std::string DumpPayload(const nlohmann::json& data) {
    return data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ToolResult MakeOkResult(const nlohmann::json& data) {
    return MakeTextResult(DumpPayload(data));
}

ToolResult MakeFailure(const std::string& message) {
    return MakeTextResult(DumpPayload({{"success", false}, {"error", message}}),
                          true);
}

template <typename T>
T Unwrap(Result<T, Error> result) {
    if (result.IsErr()) {
        throw ToolExecutionError(std::move(result).Error());
    }
    return std::move(result).Value();
}

// Arguments are schema-checked before a handler runs.
std::string Str(const nlohmann::json& args, const char* key) {
    return args.at(key).get<std::string>();
}

// Read wide so an out-of-range value cannot wrap into range.
std::int64_t OptInt(const nlohmann::json& args, const char* key,
                    std::int64_t default_val) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number_integer()) return default_val;
    if (it->is_number_unsigned() &&
        it->get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return it->get<std::int64_t>();
}

// Read per call so a rotated credential is picked up without a restart.
std::optional<std::string> ResolveToken(const SlackToolOptions& opts) {
    if (!opts.credentials) return std::nullopt;
    return opts.credentials();
}

std::string ToHex(const Blob& blob) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(blob.size() * 2);
    for (auto b : blob) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Database tools
// ---------------------------------------------------------------------------

// list_tables
ToolResult HandleListTables(const ConnectionProvider& provider,
                            const nlohmann::json& /*args*/) {
    auto conn = Unwrap(provider.Acquire());
    auto tables = Unwrap(ListTables(conn));
    return MakeOkResult({{"tables", tables}});
}

// describe_table
ToolResult HandleDescribeTable(const ConnectionProvider& provider,
                               const nlohmann::json& args) {
    const auto table = Str(args, "table_name");
    auto conn = Unwrap(provider.Acquire());
    auto columns = Unwrap(DescribeTable(conn, table));

    nlohmann::json cols = nlohmann::json::array();
    for (const auto& c : columns) {
        cols.push_back({{"name", c.name},
                        {"type", c.type},
                        {"notnull", c.not_null},
                        {"pk", c.pk}});
    }
    return MakeOkResult({{"table", table}, {"columns", cols}});
}

// read_query
ToolResult HandleReadQuery(const ConnectionProvider& provider,
                           const nlohmann::json& args) {
    auto conn = Unwrap(provider.Acquire());
    auto result = Unwrap(ReadQuery(conn, Str(args, "query")));
    return MakeOkResult(QueryResultToJson(result));
}

// write_query
ToolResult HandleWriteQuery(const ConnectionProvider& provider,
                            const nlohmann::json& args) {
    auto conn = Unwrap(provider.Acquire());
    auto result = Unwrap(WriteQuery(conn, Str(args, "query")));
    LogInfo("mcp", "write_query affected " +
                       std::to_string(result.affected_rows) + " rows");
    return MakeOkResult({{"affected_rows", result.affected_rows}});
}

// ---------------------------------------------------------------------------
// Slack tools
// ---------------------------------------------------------------------------

// read_thread
ToolResult HandleReadThread(ISlackSession& session,
                            const SlackToolOptions& opts,
                            const nlohmann::json& args) {
    const auto token = ResolveToken(opts);
    if (!token) {
        return MakeFailure(opts.token_name + " not configured");
    }

    const auto limit = OptInt(args, "limit", opts.default_thread_limit);
    if (limit < 1 || limit > kMaxThreadLimit) {
        return MakeFailure("limit must be between 1 and " +
                           std::to_string(kMaxThreadLimit));
    }

    auto result = ReadThread(session, *token, Str(args, "channel"),
                             Str(args, "thread_ts"), static_cast<int>(limit));
    if (result.IsErr()) {
        LogWarn("mcp", "read_thread failed: " + result.Error().ToString());
        return MakeFailure(result.Error().message);
    }

    nlohmann::json messages = nlohmann::json::array();
    for (const auto& m : result.Value()) {
        messages.push_back({{"role", RoleName(m.role)}, {"text", m.text}});
    }
    return MakeOkResult({{"success", true}, {"messages", messages}});
}

// send_message
ToolResult HandleSendMessage(ISlackSession& session,
                             const SlackToolOptions& opts,
                             const nlohmann::json& args) {
    const auto token = ResolveToken(opts);
    if (!token) {
        return MakeFailure(opts.token_name + " not configured");
    }

    auto result = PostMessage(session, *token, Str(args, "channel"),
                              Str(args, "message"));
    if (result.IsErr()) {
        LogWarn("mcp", "send_message failed: " + result.Error().ToString());
        return MakeFailure(result.Error().message);
    }

    const auto& posted = result.Value();
    return MakeOkResult({{"success", true},
                         {"channel", posted.channel},
                         {"ts", posted.ts}});
}

} // anonymous namespace

nlohmann::json ValueToJson(const Value& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::json {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>) {
                return nullptr;
            } else if constexpr (std::is_same_v<V, Blob>) {
                return ToHex(v);
            } else {
                return v;
            }
        },
        value);
}

nlohmann::json QueryResultToJson(const QueryResult& result) {
    nlohmann::json rows = nlohmann::json::array();
    const auto shown = std::min(result.rows.size(), kMaxDisplayRows);
    for (std::size_t i = 0; i < shown; ++i) {
        nlohmann::json row = nlohmann::json::array();
        for (const auto& cell : result.rows[i]) {
            row.push_back(ValueToJson(cell));
        }
        rows.push_back(std::move(row));
    }

    nlohmann::json j = {{"columns", result.columns},
                        {"rows", std::move(rows)},
                        {"row_count", result.rows.size()}};
    if (result.rows.size() > shown) {
        j["omitted_rows"] = result.rows.size() - shown;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void RegisterDatabaseTools(ToolRegistry& registry,
                           const ConnectionProvider& provider) {
    const auto* p = &provider;

    registry.Register(
        "list_tables",
        "List all tables in the SQLite database",
        ToolInputSchema{},
        [p](const nlohmann::json& args) { return HandleListTables(*p, args); });

    registry.Register(
        "describe_table",
        "Get the schema of a specific table: column name, declared type, "
        "not-null flag and primary-key position",
        ToolInputSchema{{"table_name", ParamType::String, "Name of the table"}},
        [p](const nlohmann::json& args) { return HandleDescribeTable(*p, args); });

    registry.Register(
        "read_query",
        "Execute a SELECT query on the SQLite database. At most 100 rows "
        "are returned; row_count gives the full total.",
        ToolInputSchema{{"query", ParamType::String, "SQL SELECT query to execute"}},
        [p](const nlohmann::json& args) { return HandleReadQuery(*p, args); });

    registry.Register(
        "write_query",
        "Execute an INSERT, UPDATE, or DELETE query and commit it",
        ToolInputSchema{{"query", ParamType::String, "SQL query to execute"}},
        [p](const nlohmann::json& args) { return HandleWriteQuery(*p, args); });
}

void RegisterSlackTools(ToolRegistry& registry, ISlackSession& session,
                        SlackToolOptions options) {
    auto opts = std::make_shared<const SlackToolOptions>(std::move(options));
    auto* s = &session;

    registry.Register(
        "read_thread",
        "Read the most recent messages of a Slack thread. Bot progress "
        "messages are removed; each message is labelled user or assistant.",
        ToolInputSchema{
            {"channel", ParamType::String, "Channel ID containing the thread"},
            {"thread_ts", ParamType::String, "Timestamp of the thread's parent message"},
            {"limit", ParamType::Integer,
             "Maximum number of messages to return (default " +
                 std::to_string(opts->default_thread_limit) + ")",
             false},
        },
        [s, opts](const nlohmann::json& args) {
            return HandleReadThread(*s, *opts, args);
        });

    registry.Register(
        "send_message",
        "Post a message to a Slack channel. Only call this after a human "
        "has approved the exact message text.",
        ToolInputSchema{
            {"channel", ParamType::String, "Channel ID to post to"},
            {"message", ParamType::String, "Message text"},
        },
        [s, opts](const nlohmann::json& args) {
            return HandleSendMessage(*s, *opts, args);
        });
}

} // namespace sqlite_mcp
