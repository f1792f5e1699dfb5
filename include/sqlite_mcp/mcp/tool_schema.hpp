#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sqlite_mcp {

enum class ParamType {
    String,
    Integer,
};

[[nodiscard]] const char* ParamTypeName(ParamType type);

// ---------------------------------------------------------------------------
// ToolParam: one named argument a tool accepts.
// ---------------------------------------------------------------------------
struct ToolParam {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    bool required = true;
};

// ---------------------------------------------------------------------------
// ToolInputSchema: typed declaration of a tool's arguments.
//
// Serialises to the JSON Schema object advertised by tools/list and checks
// incoming arguments before a handler sees them, so handlers may read
// required parameters without re-checking presence or type.
// ---------------------------------------------------------------------------
class ToolInputSchema {
public:
    ToolInputSchema() = default;
    ToolInputSchema(std::initializer_list<ToolParam> params);

    [[nodiscard]] const std::vector<ToolParam>& Params() const noexcept {
        return params_;
    }

    /// {"type":"object","properties":{...},"required":[...]}
    [[nodiscard]] nlohmann::json ToJson() const;

    /// Throws std::invalid_argument on an empty or duplicated parameter name.
    void Validate() const;

    /// nullopt if `arguments` satisfies the schema, else a message naming
    /// the first offending parameter.
    [[nodiscard]] std::optional<std::string> CheckArguments(
        const nlohmann::json& arguments) const;

private:
    std::vector<ToolParam> params_;
};

} // namespace sqlite_mcp
