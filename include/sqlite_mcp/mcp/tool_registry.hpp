#pragma once

#include <sqlite_mcp/core/result.hpp>
#include <sqlite_mcp/mcp/tool_schema.hpp>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sqlite_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor: what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    ToolInputSchema input_schema;
};

// ---------------------------------------------------------------------------
// ToolResult: result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
};

// ---------------------------------------------------------------------------
// ToolExecutionError: thrown by a handler whose failure should reach the
// caller as a JSON-RPC error rather than a tool result. what() is the
// underlying Error's message, unmodified.
// ---------------------------------------------------------------------------
class ToolExecutionError : public std::runtime_error {
public:
    explicit ToolExecutionError(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

// A tool handler takes the (already schema-checked) arguments object.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: the fixed tool catalogue.
//
// Filled once at startup and not modified afterwards. Tools() preserves
// registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Throws std::invalid_argument on an empty or duplicate tool name, a
    /// malformed schema, or an empty handler.
    void Register(const std::string& name,
                  const std::string& description,
                  ToolInputSchema input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Handler for `name`, or nullptr if no such tool is registered.
    [[nodiscard]] const ToolHandler* Find(const std::string& name) const;

    /// Check `arguments` against the tool's schema and run its handler.
    /// Argument problems and unknown names come back as error results;
    /// exceptions thrown by the handler propagate to the caller.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
    std::map<std::string, std::size_t> index_;
};

/// A single text content block.
[[nodiscard]] ToolResult MakeTextResult(const std::string& text, bool is_error = false);

} // namespace sqlite_mcp
