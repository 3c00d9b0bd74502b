#pragma once

#include <mcp_rails/config/app_config.hpp>
#include <mcp_rails/mcp/content_resolver.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_rails {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kJsonRpcVersion = "2.0";

// JSON-RPC error codes. kParseError is never sent: unparsable lines carry
// no recoverable id and are dropped.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32000;

// The closed set of methods this server routes.
enum class RequestKind {
    Initialize,
    Initialized,
    ToolsList,
    ToolsCall,
    PromptsList,
    PromptsGet,
};

/// Exact, case-sensitive lookup of a JSON-RPC method name.
std::optional<RequestKind> ParseRequestKind(std::string_view method);

// ---------------------------------------------------------------------------
// ServerContext: everything the server answers from. Built once at startup
// and never modified afterwards.
// ---------------------------------------------------------------------------
struct ServerContext {
    AppConfig config;
    ServerManifest manifest;
    std::vector<PromptDescriptor> prompts;

    static ServerContext FromConfig(AppConfig config);
};

struct McpServerOptions {
    // Echo every outgoing JSON line to the log (MCP_DEBUG / --debug).
    bool echo_responses = false;
};

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Reads one JSON-RPC 2.0 message per line and writes at most one response
// line per message:
//   - initialize, tools/list, tools/call, prompts/list, prompts/get
//   - initialized and any message without an id: logged, never answered
//   - unparsable lines: logged and dropped
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ServerContext context,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout,
                       McpServerOptions options = {});

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Parse, handle and answer one input line. Never throws.
    void ProcessLine(const std::string& line);

    // Handle a parsed message and return the response, or nullopt when no
    // response is due. May throw; ProcessLine() turns that into an
    // internal error for addressed requests.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] const ServerContext& Context() const noexcept {
        return context_;
    }

private:
    std::optional<nlohmann::json> Route(RequestKind kind,
                                        const nlohmann::json& params,
                                        const nlohmann::json& id);

    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandlePromptsList(const nlohmann::json& id);
    nlohmann::json HandlePromptsGet(const nlohmann::json& params,
                                    const nlohmann::json& id);

    nlohmann::json MakeError(const nlohmann::json& id,
                             int code, const std::string& message);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);
    void WriteResponse(const nlohmann::json& response);

    const ServerContext context_;
    std::istream& in_;
    std::ostream& out_;
    McpServerOptions options_;
};

} // namespace mcp_rails
