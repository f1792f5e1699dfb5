#include <sqlite_mcp/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define SQLITE_MCP_ISATTY(f) (_isatty(_fileno(f)) != 0)
#else
#include <unistd.h>
#define SQLITE_MCP_ISATTY(f) (isatty(fileno(f)) != 0)
#endif

namespace sqlite_mcp {

bool IsStderrTty() { return SQLITE_MCP_ISATTY(stderr); }

bool IsStdinTty() { return SQLITE_MCP_ISATTY(stdin); }

bool NoColorEnvSet() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && value[0] != '\0';
}

} // namespace sqlite_mcp
