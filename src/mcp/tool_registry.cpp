#include <sqlite_mcp/mcp/tool_registry.hpp>

namespace sqlite_mcp {

ToolResult MakeTextResult(const std::string& text, bool is_error) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            ToolInputSchema input_schema,
                            ToolHandler handler) {
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (HasTool(name)) {
        throw std::invalid_argument("Tool already registered: " + name);
    }
    if (!handler) {
        throw std::invalid_argument("Tool has no handler: " + name);
    }
    input_schema.Validate();

    index_[name] = descriptors_.size();
    descriptors_.push_back({name, description, std::move(input_schema)});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolHandler* ToolRegistry::Find(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    const auto* handler = Find(name);
    if (handler == nullptr) {
        return MakeTextResult("Unknown tool: " + name, true);
    }

    const auto& schema = descriptors_[index_.at(name)].input_schema;
    if (auto problem = schema.CheckArguments(arguments)) {
        return MakeTextResult(*problem, true);
    }

    return (*handler)(arguments);
}

} // namespace sqlite_mcp
