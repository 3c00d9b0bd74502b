#include <mcp_rails/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_rails {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    const char* val = std::getenv("NO_COLOR");
    return val != nullptr;
}

bool McpDebugEnvSet() {
    const char* val = std::getenv("MCP_DEBUG");
    return val != nullptr;
}

} // namespace mcp_rails
