#pragma once

namespace sqlite_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdin is a terminal. The server warns when it is started
/// interactively instead of by a client process.
bool IsStdinTty();

/// True when NO_COLOR is set to a non-empty value (https://no-color.org/).
bool NoColorEnvSet();

} // namespace sqlite_mcp
