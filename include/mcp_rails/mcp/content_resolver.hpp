#pragma once

#include <mcp_rails/config/app_config.hpp>
#include <mcp_rails/mcp/template_engine.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_rails {

// ---------------------------------------------------------------------------
// ToolDescriptor: what tools/list advertises. Content is resolved by name
// against the full ToolConfig only when the tool is called.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<ArgumentSpec> arguments;
};

// ---------------------------------------------------------------------------
// ServerManifest: server identity and tool catalog, built once at startup.
// ---------------------------------------------------------------------------
struct ServerManifest {
    std::string name;
    std::string version;
    std::vector<ToolDescriptor> tools;
};

ServerManifest BuildServerManifest(const AppConfig& config);
std::vector<PromptDescriptor> BuildPromptCatalog(const AppConfig& config);

nlohmann::json ToJson(const ToolDescriptor& tool);
nlohmann::json ToJson(const PromptDescriptor& prompt);

// First match by name, or nullptr.
const ToolConfig* FindTool(const AppConfig& config, const std::string& name);
const PromptConfig* FindPrompt(const AppConfig& config, const std::string& name);

// Markdown for a structured tool body:
//   ### {title}            (+ blank line, only with a title)
//   {intro}                (+ blank line, only with an intro)
//   {n}.  **{name}:** {description}   (one per rule, 1-based)
//   <blank>, ---, *{footer}*          (only with a footer)
std::string BuildMarkdownFromStructure(const ToolContent& content);

// Default for an argument the caller omitted:
// focus_areas -> "general", language -> "auto-detect", format -> "markdown",
// anything else -> "".
std::string DefaultValueFor(const std::string& argument_name);

// Copy `arguments` and fill every declared argument that is missing or null.
Variables ApplyArgumentDefaults(const PromptConfig& prompt,
                                const Variables& arguments);

// tools/call result: {"content": [{"type": "text", "text": ...}]}.
// nullopt when no tool has that name.
std::optional<nlohmann::json> ResolveTool(const AppConfig& config,
                                          const std::string& name);

// prompts/get result: {"messages": [{"role": "user", "content": {...}}]}.
// nullopt when no prompt has that name.
std::optional<nlohmann::json> ResolvePrompt(const AppConfig& config,
                                            const std::string& name,
                                            const Variables& arguments);

} // namespace mcp_rails
