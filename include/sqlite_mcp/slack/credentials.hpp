#pragma once

#include <functional>
#include <optional>
#include <string>

namespace sqlite_mcp {

// Resolves the bot token at the moment of a call. Returns nullopt when no
// usable token is configured. Sources must not cache: a rotated token is
// picked up by the next call.
using CredentialSource = std::function<std::optional<std::string>()>;

// Reads the environment variable `env_var` on every invocation. An unset
// or empty variable yields nullopt.
CredentialSource EnvCredential(std::string env_var);

} // namespace sqlite_mcp
