#pragma once

#include <sqlite_mcp/core/log.hpp>
#include <sqlite_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace sqlite_mcp {

// JSON-RPC 2.0 error codes.
namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
// Server-defined: any exception escaping a tool handler.
constexpr int kInternalError = -32000;
} // namespace rpc

constexpr const char* kProtocolVersion = "2024-11-05";

enum class McpMethod {
    Initialize,
    Initialized,
    ToolsList,
    ToolsCall,
    Ping,
    Unknown,
};

[[nodiscard]] McpMethod ParseMethod(std::string_view method);

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over line-delimited stdin/stdout.
//
// Implements JSON-RPC 2.0 with MCP methods:
//   - initialize
//   - notifications/initialized (notification, no response)
//   - tools/list
//   - tools/call
//   - ping
//
// Requests are handled one at a time in arrival order. Messages without an
// "id" are notifications and never produce output. Diagnostics go to the
// injected logger, never to the output stream.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout,
                       Logger& logger = GlobalLogger());

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process one raw input line. Returns nullopt for blank lines and
    // notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(std::string_view line);

    // Process a single parsed JSON-RPC message and return the response (if any).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    // True once an initialize request has been answered.
    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    nlohmann::json Dispatch(McpMethod method, const std::string& name,
                            const nlohmann::json& params,
                            const nlohmann::json& id);
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    Logger& logger_;
    bool initialized_ = false;
};

} // namespace sqlite_mcp
