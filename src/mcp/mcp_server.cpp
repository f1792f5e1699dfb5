#include <sqlite_mcp/mcp/mcp_server.hpp>

#include <sqlite_mcp/core/version.hpp>

#include <exception>
#include <string>

namespace sqlite_mcp {

namespace {

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string Serialize(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

McpMethod ParseMethod(std::string_view method) {
    if (method == "initialize") return McpMethod::Initialize;
    if (method == "notifications/initialized") return McpMethod::Initialized;
    if (method == "tools/list") return McpMethod::ToolsList;
    if (method == "tools/call") return McpMethod::ToolsCall;
    if (method == "ping") return McpMethod::Ping;
    return McpMethod::Unknown;
}

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out,
                     Logger& logger)
    : registry_(std::move(registry)), in_(in), out_(out), logger_(logger) {}

void McpServer::Run() {
    logger_.Info("mcp", "Server ready, " +
                            std::to_string(registry_.Tools().size()) + " tools");

    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (!response) continue;

        out_ << Serialize(*response) << "\n";
        out_.flush();
        if (!out_) {
            logger_.Error("mcp", "Output stream closed, stopping");
            return;
        }
    }
    logger_.Info("mcp", "End of input, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleLine(std::string_view line) {
    const auto text = Trim(line);
    if (text.empty()) return std::nullopt;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(std::string(text));
    } catch (const nlohmann::json::parse_error& e) {
        logger_.Warn("mcp", std::string("Unparseable input line: ") + e.what());
        return MakeError(nullptr, rpc::kParseError,
                         std::string("Parse error: ") + e.what());
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, rpc::kInvalidRequest,
                         "Invalid Request: message must be an object");
    }

    // Notifications have no "id".
    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    // A missing "jsonrpc" marker is tolerated; a wrong one is not.
    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0") {
        if (is_notification) return std::nullopt;
        return MakeError(id, rpc::kInvalidRequest, "Invalid JSON-RPC version");
    }

    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (is_notification) return std::nullopt;
        return MakeError(id, rpc::kInvalidRequest, "Invalid Request: missing method");
    }
    const auto name = method_it->get<std::string>();
    const auto method = ParseMethod(name);

    if (is_notification) {
        logger_.Debug("mcp", "Notification: " + name);
        return std::nullopt;
    }

    nlohmann::json params = nlohmann::json::object();
    if (auto it = message.find("params"); it != message.end() && it->is_object()) {
        params = *it;
    }

    logger_.Debug("mcp", "Request " + id.dump() + ": " + name);
    try {
        return Dispatch(method, name, params, id);
    } catch (const std::exception& e) {
        logger_.Error("mcp", "Request " + id.dump() + " (" + name +
                                 ") failed: " + e.what());
        return MakeError(id, rpc::kInternalError, e.what());
    }
}

nlohmann::json McpServer::Dispatch(McpMethod method, const std::string& name,
                                   const nlohmann::json& params,
                                   const nlohmann::json& id) {
    switch (method) {
        case McpMethod::Initialize:
            return HandleInitialize(id);
        case McpMethod::ToolsList:
            return HandleToolsList(id);
        case McpMethod::ToolsCall:
            return HandleToolsCall(params, id);
        case McpMethod::Ping:
            return MakeResult(id, nlohmann::json::object());
        case McpMethod::Initialized:
            // Only meaningful as a notification; sent with an id it is
            // not a request this server knows.
        case McpMethod::Unknown:
            break;
    }
    return MakeError(id, rpc::kMethodNotFound, "Method not found: " + name);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    initialized_ = true;

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& tool : registry_.Tools()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema.ToJson()}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!initialized_) {
        logger_.Debug("mcp", "tools/call before initialize");
    }

    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeError(id, rpc::kInvalidParams, "Missing 'name' parameter");
    }
    const auto tool_name = name_it->get<std::string>();

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, rpc::kMethodNotFound, "Unknown tool: " + tool_name);
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
        arguments = *it;
    }

    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace sqlite_mcp
