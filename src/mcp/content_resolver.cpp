#include <mcp_rails/mcp/content_resolver.hpp>

#include <algorithm>

namespace mcp_rails {

namespace {

nlohmann::json TextBlock(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Catalog construction
// ---------------------------------------------------------------------------
ServerManifest BuildServerManifest(const AppConfig& config) {
    ServerManifest manifest;
    manifest.name = config.server.name;
    manifest.version = config.server.version;
    manifest.tools.reserve(config.tools.size());
    for (const auto& tool : config.tools) {
        manifest.tools.push_back({tool.name, tool.description, tool.input_schema});
    }
    return manifest;
}

std::vector<PromptDescriptor> BuildPromptCatalog(const AppConfig& config) {
    std::vector<PromptDescriptor> prompts;
    prompts.reserve(config.prompts.size());
    for (const auto& prompt : config.prompts) {
        prompts.push_back({prompt.name, prompt.description, prompt.arguments});
    }
    return prompts;
}

nlohmann::json ToJson(const ToolDescriptor& tool) {
    return {
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema}
    };
}

nlohmann::json ToJson(const PromptDescriptor& prompt) {
    nlohmann::json arguments = nlohmann::json::array();
    for (const auto& arg : prompt.arguments) {
        arguments.push_back({
            {"name", arg.name},
            {"description", arg.description},
            {"required", arg.required}
        });
    }
    return {
        {"name", prompt.name},
        {"description", prompt.description},
        {"arguments", arguments}
    };
}

const ToolConfig* FindTool(const AppConfig& config, const std::string& name) {
    auto it = std::find_if(config.tools.begin(), config.tools.end(),
                           [&name](const ToolConfig& t) { return t.name == name; });
    return it == config.tools.end() ? nullptr : &*it;
}

const PromptConfig* FindPrompt(const AppConfig& config, const std::string& name) {
    auto it = std::find_if(config.prompts.begin(), config.prompts.end(),
                           [&name](const PromptConfig& p) { return p.name == name; });
    return it == config.prompts.end() ? nullptr : &*it;
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------
std::string BuildMarkdownFromStructure(const ToolContent& content) {
    std::vector<std::string> lines;
    if (content.title) {
        lines.push_back("### " + *content.title);
        lines.emplace_back();
    }
    if (content.intro) {
        lines.push_back(*content.intro);
        lines.emplace_back();
    }
    for (size_t i = 0; i < content.rules.size(); ++i) {
        const auto& rule = content.rules[i];
        lines.push_back(std::to_string(i + 1) + ".  **" + rule.name + ":** " +
                        rule.description);
    }
    if (content.footer) {
        lines.emplace_back();
        lines.emplace_back("---");
        lines.push_back("*" + *content.footer + "*");
    }
    return JoinLines(lines);
}

std::optional<nlohmann::json> ResolveTool(const AppConfig& config,
                                          const std::string& name) {
    const auto* tool = FindTool(config, name);
    if (tool == nullptr) {
        return std::nullopt;
    }

    const auto markdown = tool->content.markdown
        ? *tool->content.markdown
        : BuildMarkdownFromStructure(tool->content);

    return nlohmann::json{
        {"content", nlohmann::json::array({TextBlock(markdown)})}
    };
}

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------
std::string DefaultValueFor(const std::string& argument_name) {
    if (argument_name == "focus_areas") return "general";
    if (argument_name == "language") return "auto-detect";
    if (argument_name == "format") return "markdown";
    return "";
}

Variables ApplyArgumentDefaults(const PromptConfig& prompt,
                                const Variables& arguments) {
    Variables variables = arguments;
    for (const auto& arg : prompt.arguments) {
        auto it = variables.find(arg.name);
        if (it != variables.end() && !it->second.is_null()) {
            continue;
        }
        variables[arg.name] = DefaultValueFor(arg.name);
    }
    return variables;
}

std::optional<nlohmann::json> ResolvePrompt(const AppConfig& config,
                                            const std::string& name,
                                            const Variables& arguments) {
    const auto* prompt = FindPrompt(config, name);
    if (prompt == nullptr) {
        return std::nullopt;
    }

    const auto variables = ApplyArgumentDefaults(*prompt, arguments);
    const auto text = RenderTemplate(prompt->template_text, variables);

    return nlohmann::json{
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", TextBlock(text)}}
        })}
    };
}

} // namespace mcp_rails
