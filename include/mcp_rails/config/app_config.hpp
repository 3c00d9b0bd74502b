#pragma once

#include <mcp_rails/core/log.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_rails {

struct ServerIdentity {
    std::string name;
    std::string version;
};

struct RuleEntry {
    std::string name;
    std::string description;
};

// Tool body: a pre-rendered markdown string, or the structured parts the
// markdown is synthesized from. A present markdown always wins.
struct ToolContent {
    std::optional<std::string> markdown;
    std::optional<std::string> title;
    std::optional<std::string> intro;
    std::vector<RuleEntry> rules;
    std::optional<std::string> footer;
};

struct ToolConfig {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // opaque JSON Schema object
    ToolContent content;
};

struct ArgumentSpec {
    std::string name;
    bool required = false;
    std::string description;
};

struct PromptConfig {
    std::string name;
    std::string description;
    std::vector<ArgumentSpec> arguments;
    std::string template_text;
};

// The whole catalog file. Never mutated after loading.
struct AppConfig {
    ServerIdentity server;
    std::vector<ToolConfig> tools;
    std::vector<PromptConfig> prompts;
};

enum class ColorMode {
    Auto,
    Always,
    Never,
};

// Process options from the command line.
struct CliOptions {
    std::optional<std::string> config_path;
    LogLevel log_level = LogLevel::Info;
    bool log_json = false;
    ColorMode color = ColorMode::Auto;
    bool echo_responses = false;
    bool show_version = false;
};

} // namespace mcp_rails
