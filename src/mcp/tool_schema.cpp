#include <sqlite_mcp/mcp/tool_schema.hpp>

#include <set>
#include <stdexcept>

namespace sqlite_mcp {

namespace {

bool MatchesType(const nlohmann::json& value, ParamType type) {
    switch (type) {
        case ParamType::String:  return value.is_string();
        case ParamType::Integer: return value.is_number_integer();
    }
    return false;
}

} // anonymous namespace

const char* ParamTypeName(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
    }
    return "string";
}

ToolInputSchema::ToolInputSchema(std::initializer_list<ToolParam> params)
    : params_(params) {}

nlohmann::json ToolInputSchema::ToJson() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : params_) {
        properties[p.name] = {{"type", ParamTypeName(p.type)},
                              {"description", p.description}};
        if (p.required) {
            required.push_back(p.name);
        }
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

void ToolInputSchema::Validate() const {
    std::set<std::string> seen;
    for (const auto& p : params_) {
        if (p.name.empty()) {
            throw std::invalid_argument("Tool parameter with empty name");
        }
        if (!seen.insert(p.name).second) {
            throw std::invalid_argument("Duplicate tool parameter: " + p.name);
        }
    }
}

std::optional<std::string> ToolInputSchema::CheckArguments(
    const nlohmann::json& arguments) const {
    if (!arguments.is_object()) {
        return std::string("Tool arguments must be an object");
    }
    for (const auto& p : params_) {
        auto it = arguments.find(p.name);
        if (it == arguments.end() || it->is_null()) {
            if (p.required) {
                return "Missing required parameter: " + p.name;
            }
            continue;
        }
        if (!MatchesType(*it, p.type)) {
            return "Invalid type for parameter " + p.name + ": expected " +
                   ParamTypeName(p.type);
        }
        if (p.required && p.type == ParamType::String &&
            it->get_ref<const std::string&>().empty()) {
            return "Missing required parameter: " + p.name;
        }
    }
    return std::nullopt;
}

} // namespace sqlite_mcp
