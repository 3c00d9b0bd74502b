#pragma once

namespace mcp_rails {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Returns true if the MCP_DEBUG environment variable is set. Enables echoing
/// every outgoing JSON-RPC line to the log.
bool McpDebugEnvSet();

} // namespace mcp_rails
