#include <mcp_rails/mcp/mcp_server.hpp>

#include <mcp_rails/core/log.hpp>

#include <array>
#include <stdexcept>
#include <utility>

namespace mcp_rails {

namespace {

constexpr const char* kComponent = "mcp";

struct MethodEntry {
    std::string_view method;
    RequestKind kind;
};

constexpr std::array<MethodEntry, 6> kMethodTable = {{
    {"initialize", RequestKind::Initialize},
    {"initialized", RequestKind::Initialized},
    {"tools/list", RequestKind::ToolsList},
    {"tools/call", RequestKind::ToolsCall},
    {"prompts/list", RequestKind::PromptsList},
    {"prompts/get", RequestKind::PromptsGet},
}};

// null, false and absence all mean "not given".
bool IsFalsy(const nlohmann::json& value) {
    return value.is_null() || (value.is_boolean() && !value.get<bool>());
}

// The field's value, or nullptr when absent, null or false.
nlohmann::json FieldOrNull(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || IsFalsy(*it)) {
        return nullptr;
    }
    return *it;
}

// A message's id, or nullptr for notifications and non-object messages.
nlohmann::json IdOf(const nlohmann::json& message) {
    if (!message.is_object()) {
        return nullptr;
    }
    auto it = message.find("id");
    return it == message.end() ? nlohmann::json(nullptr) : *it;
}

std::string DisplayValue(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

template <typename Descriptor>
std::string JoinNames(const std::vector<Descriptor>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i].name;
    }
    return out;
}

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

std::optional<RequestKind> ParseRequestKind(std::string_view method) {
    for (const auto& entry : kMethodTable) {
        if (entry.method == method) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

ServerContext ServerContext::FromConfig(AppConfig config) {
    auto manifest = BuildServerManifest(config);
    auto prompts = BuildPromptCatalog(config);
    return ServerContext{std::move(config), std::move(manifest), std::move(prompts)};
}

McpServer::McpServer(ServerContext context,
                     std::istream& in,
                     std::ostream& out,
                     McpServerOptions options)
    : context_(std::move(context)), in_(in), out_(out), options_(options) {}

void McpServer::Run() {
    LogInfo(kComponent, "MCP server " + context_.manifest.name + " " +
                        context_.manifest.version +
                        " started. Waiting for requests on stdin...");

    std::string line;
    while (std::getline(in_, line)) {
        ProcessLine(line);
    }

    LogInfo(kComponent, "End of input, shutting down");
}

void McpServer::ProcessLine(const std::string& line) {
    if (IsBlank(line)) {
        LogDebug(kComponent, "Skipping blank input line");
        return;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        // No id can be recovered, so there is nobody to answer.
        LogError(kComponent, std::string("Failed to parse JSON input: ") + e.what());
        return;
    }

    try {
        auto response = HandleMessage(message);
        if (response) {
            WriteResponse(*response);
        }
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Fatal error while handling message: ") + e.what());

        const auto id = IdOf(message);
        if (id.is_null()) {
            return;
        }
        try {
            WriteResponse(MakeError(id, kInternalError,
                                    std::string("Server execution error: ") + e.what()));
        } catch (const std::exception& write_error) {
            LogError(kComponent, std::string("Failed to send internal error response: ") +
                                 write_error.what());
        }
    }
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        LogWarn(kComponent, "Ignoring message that is not a JSON object");
        return std::nullopt;
    }

    // Notifications have no id (or a null one) and are never answered.
    const auto id = IdOf(message);
    const auto method = FieldOrNull(message, "method");

    if (id.is_null()) {
        LogInfo(kComponent, "<- Received " +
                            (method.is_null() ? std::string("(no method)") : DisplayValue(method)) +
                            " notification");
        return std::nullopt;
    }

    if (method.is_null()) {
        const std::string error_message = "Invalid Request: missing 'method'";
        LogError(kComponent, "<- Sent error response: " + error_message);
        return MakeError(id, kInvalidRequest, error_message);
    }

    const auto method_name = DisplayValue(method);
    LogInfo(kComponent, "-> Received request (id: " + DisplayValue(id) +
                        ", method: " + method_name + ")");

    const auto kind = method.is_string() ? ParseRequestKind(method_name)
                                         : std::nullopt;
    if (!kind) {
        const auto error_message = "Unknown JSON-RPC method: " + method_name;
        LogError(kComponent, "<- Sent error response: " + error_message);
        return MakeError(id, kMethodNotFound, error_message);
    }

    // Methods without parameters ignore whatever was sent. For tools/call and
    // prompts/get a non-object carries no 'name' and is rejected as such.
    auto params = FieldOrNull(message, "params");
    if (!params.is_object()) {
        params = nlohmann::json::object();
    }

    return Route(*kind, params, id);
}

std::optional<nlohmann::json> McpServer::Route(RequestKind kind,
                                               const nlohmann::json& params,
                                               const nlohmann::json& id) {
    switch (kind) {
        case RequestKind::Initialize:
            return HandleInitialize(id);
        case RequestKind::Initialized:
            LogInfo(kComponent, "<- Received initialized notification");
            return std::nullopt;
        case RequestKind::ToolsList:
            return HandleToolsList(id);
        case RequestKind::ToolsCall:
            return HandleToolsCall(params, id);
        case RequestKind::PromptsList:
            return HandlePromptsList(id);
        case RequestKind::PromptsGet:
            return HandlePromptsGet(params, id);
    }
    throw std::logic_error("unhandled request kind");
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}},
        {"prompts", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", context_.manifest.name},
        {"version", context_.manifest.version}
    };

    LogInfo(kComponent, "<- Sent initialize response");
    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : context_.manifest.tools) {
        tools.push_back(ToJson(tool));
    }

    LogInfo(kComponent, "<- Sending tools/list response with " +
                        std::to_string(tools.size()) + " tool(s): " +
                        JoinNames(context_.manifest.tools));
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    const auto name = FieldOrNull(params, "name");
    if (name.is_null()) {
        return MakeError(id, kInvalidParams, "Invalid params: missing 'name'");
    }

    const auto tool_name = DisplayValue(name);
    auto result = name.is_string() ? ResolveTool(context_.config, tool_name)
                                   : std::nullopt;
    if (!result) {
        const auto error_message = "Unknown tool: " + tool_name;
        LogError(kComponent, "<- Sent error response: " + error_message);
        return MakeError(id, kMethodNotFound, error_message);
    }

    LogInfo(kComponent, "<- Sent tools/call response for " + tool_name);
    return MakeResult(id, *result);
}

nlohmann::json McpServer::HandlePromptsList(const nlohmann::json& id) {
    nlohmann::json prompts = nlohmann::json::array();
    for (const auto& prompt : context_.prompts) {
        prompts.push_back(ToJson(prompt));
    }

    LogInfo(kComponent, "<- Sending prompts/list response with " +
                        std::to_string(prompts.size()) + " prompt(s): " +
                        JoinNames(context_.prompts));
    return MakeResult(id, {{"prompts", prompts}});
}

nlohmann::json McpServer::HandlePromptsGet(
    const nlohmann::json& params, const nlohmann::json& id) {
    const auto name = FieldOrNull(params, "name");
    if (name.is_null()) {
        return MakeError(id, kInvalidParams, "Invalid params: missing 'name'");
    }

    const auto arguments = FieldOrNull(params, "arguments");
    if (!arguments.is_null() && !arguments.is_object()) {
        return MakeError(id, kInvalidParams,
                         "Invalid params: 'arguments' must be an object");
    }

    Variables variables;
    if (arguments.is_object()) {
        for (const auto& item : arguments.items()) {
            variables[item.key()] = item.value();
        }
    }

    const auto prompt_name = DisplayValue(name);
    auto result = name.is_string()
        ? ResolvePrompt(context_.config, prompt_name, variables)
        : std::nullopt;
    if (!result) {
        const auto error_message = "Unknown prompt: " + prompt_name;
        LogError(kComponent, "<- Sent error response: " + error_message);
        return MakeError(id, kMethodNotFound, error_message);
    }

    LogInfo(kComponent, "<- Sent prompts/get response for " + prompt_name);
    return MakeResult(id, *result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

void McpServer::WriteResponse(const nlohmann::json& response) {
    // Serialize first: dump() throws on invalid UTF-8 and nothing partial
    // may reach the output stream.
    const auto line = response.dump();
    out_ << line << '\n';
    out_.flush();

    if (options_.echo_responses) {
        LogInfo(kComponent, "   JSON output: " + line);
    }
    if (!out_) {
        throw std::runtime_error("failed to write response to output stream");
    }
}

} // namespace mcp_rails
