#include <sqlite_mcp/slack/credentials.hpp>

#include <cstdlib>

namespace sqlite_mcp {

CredentialSource EnvCredential(std::string env_var) {
    return [env_var = std::move(env_var)]() -> std::optional<std::string> {
        const char* value = std::getenv(env_var.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

} // namespace sqlite_mcp
