#include <mcp_rails/config/config_loader.hpp>

#include <mcp_rails/core/log.hpp>
#include <mcp_rails/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <system_error>

#ifndef MCP_RAILS_DEFAULT_CONFIG
#define MCP_RAILS_DEFAULT_CONFIG "mcp_rails.yml"
#endif

namespace mcp_rails {

namespace {

Error MakeConfigError(ErrorCategory category, const std::string& message) {
    return Error{"ConfigLoader", message, category};
}

Error MakeInvalid(const std::string& detail) {
    return MakeConfigError(ErrorCategory::ConfigInvalid, "Invalid config: " + detail);
}

std::optional<std::string> OptionalString(const YAML::Node& node, const char* key) {
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        return std::nullopt;
    }
    return child.as<std::string>();
}

std::string StringOr(const YAML::Node& node, const char* key,
                     const std::string& fallback = "") {
    return OptionalString(node, key).value_or(fallback);
}

bool IsNullScalar(const std::string& text) {
    return text.empty() || text == "~" || text == "null" ||
           text == "Null" || text == "NULL";
}

// Convert an arbitrary YAML node to JSON. Plain scalars are resolved the way
// a YAML loader would type them (null, bool, integer, float, string); quoted
// scalars always stay strings.
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const auto& text = node.Scalar();
            if (node.Tag() == "!") {
                return text;
            }
            if (IsNullScalar(text)) {
                return nullptr;
            }
            bool b = false;
            if (YAML::convert<bool>::decode(node, b)) {
                return b;
            }
            long long i = 0;
            if (YAML::convert<long long>::decode(node, i)) {
                return i;
            }
            double d = 0.0;
            if (YAML::convert<double>::decode(node, d)) {
                return d;
            }
            return text;
        }
        case YAML::NodeType::Sequence: {
            auto array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            auto object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = YamlToJson(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

nlohmann::json DefaultInputSchema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolContent ParseYamlContent(const YAML::Node& node) {
    ToolContent content;
    if (!node || !node.IsMap()) {
        return content;
    }
    content.markdown = OptionalString(node, "markdown");
    content.title = OptionalString(node, "title");
    content.intro = OptionalString(node, "intro");
    content.footer = OptionalString(node, "footer");

    // A non-list "rules" entry contributes nothing.
    const YAML::Node rules = node["rules"];
    if (rules && rules.IsSequence()) {
        for (const auto& rule : rules) {
            content.rules.push_back(RuleEntry{
                StringOr(rule, "name"),
                StringOr(rule, "description"),
            });
        }
    }
    return content;
}

ToolConfig ParseYamlTool(const YAML::Node& node) {
    ToolConfig tool;
    tool.name = StringOr(node, "name");
    tool.description = StringOr(node, "description");

    const YAML::Node schema = node["inputSchema"];
    tool.input_schema = (schema && !schema.IsNull())
        ? YamlToJson(schema)
        : DefaultInputSchema();

    tool.content = ParseYamlContent(node["content"]);
    return tool;
}

PromptConfig ParseYamlPrompt(const YAML::Node& node) {
    PromptConfig prompt;
    prompt.name = StringOr(node, "name");
    prompt.description = StringOr(node, "description");
    prompt.template_text = StringOr(node, "template");

    const YAML::Node arguments = node["arguments"];
    if (arguments && arguments.IsSequence()) {
        for (const auto& arg : arguments) {
            ArgumentSpec spec;
            spec.name = StringOr(arg, "name");
            spec.description = StringOr(arg, "description");
            if (arg["required"] && !arg["required"].IsNull()) {
                spec.required = arg["required"].as<bool>();
            }
            prompt.arguments.push_back(std::move(spec));
        }
    }
    return prompt;
}

Result<AppConfig, Error> ParseYamlDocument(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeInvalid("top level must be a mapping"));
    }

    AppConfig config;

    // -- Server --
    const YAML::Node server = root["server"];
    if (server && server.IsMap()) {
        config.server.name = StringOr(server, "name");
        config.server.version = StringOr(server, "version");
    }

    // -- Tools --
    const YAML::Node tools = root["tools"];
    if (tools && !tools.IsNull()) {
        if (!tools.IsSequence()) {
            return Result<AppConfig, Error>::Err(MakeInvalid("'tools' must be a list"));
        }
        for (const auto& tool_node : tools) {
            config.tools.push_back(ParseYamlTool(tool_node));
        }
    }

    // -- Prompts --
    const YAML::Node prompts = root["prompts"];
    if (prompts && !prompts.IsNull()) {
        if (!prompts.IsSequence()) {
            return Result<AppConfig, Error>::Err(MakeInvalid("'prompts' must be a list"));
        }
        for (const auto& prompt_node : prompts) {
            config.prompts.push_back(ParseYamlPrompt(prompt_node));
        }
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// Wrong-typed entries (a mapping where a string belongs) surface as
// YAML::BadConversion while walking the document.
Result<AppConfig, Error> ParseYamlDocumentChecked(const YAML::Node& root) {
    try {
        return ParseYamlDocument(root);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(MakeInvalid(e.what()));
    }
}

void WarnOnDuplicates(const std::vector<std::string>& names, const char* kind) {
    std::set<std::string> seen;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            LogWarn("config", std::string("Duplicate ") + kind + " name '" + name +
                              "'; only the first definition is reachable");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            ErrorCategory::ConfigNotFound, "Config file not found: " + path));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::ParserException& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            ErrorCategory::ConfigParse,
            "Failed to parse config file: " + std::string(e.what())));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            ErrorCategory::ConfigParse,
            "Failed to load config file: " + std::string(e.what())));
    }

    LogDebug("config", "Loaded " + path);
    return ParseYamlDocumentChecked(root);
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            ErrorCategory::ConfigParse,
            "Failed to parse config file: " + std::string(e.what())));
    }
    return ParseYamlDocumentChecked(root);
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-rails", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Serve a YAML catalog of tools and prompts over MCP "
        "(JSON-RPC 2.0, one message per line on stdin/stdout).");

    program.add_argument("-c", "--config")
        .help("Path to YAML catalog (default: ~/.mcp_rails.yml, "
              "./.mcp_rails.yml, then the installed catalog)");
    program.add_argument("-v", "--verbose")
        .help("Debug-level diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only warnings and errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Write diagnostics as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Echo every outgoing JSON-RPC line to the diagnostics stream "
              "(same as MCP_DEBUG=1)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<CliOptions, Error>::Err(Error{
            "CommandLine", "CLI parse error: " + std::string(e.what()),
            ErrorCategory::Usage});
    }

    CliOptions options;
    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }

    const bool verbose = program.get<bool>("--verbose");
    const bool quiet = program.get<bool>("--quiet");
    if (verbose && quiet) {
        return Result<CliOptions, Error>::Err(Error{
            "CommandLine", "--verbose and --quiet are mutually exclusive",
            ErrorCategory::Usage});
    }
    if (verbose) {
        options.log_level = LogLevel::Debug;
    } else if (quiet) {
        options.log_level = LogLevel::Warn;
    }

    const bool color = program.get<bool>("--color");
    const bool no_color = program.get<bool>("--no-color");
    if (color && no_color) {
        return Result<CliOptions, Error>::Err(Error{
            "CommandLine", "--color and --no-color are mutually exclusive",
            ErrorCategory::Usage});
    }
    if (color) {
        options.color = ColorMode::Always;
    } else if (no_color) {
        options.color = ColorMode::Never;
    }

    options.log_json = program.get<bool>("--log-json");
    options.echo_responses = program.get<bool>("--debug");
    options.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// Config path resolution
// ---------------------------------------------------------------------------
std::string FindConfigPath(const std::string& home, const std::string& cwd,
                           const std::string& default_path) {
    std::error_code ec;
    if (!home.empty()) {
        auto home_config = (std::filesystem::path(home) / kConfigFileName).string();
        if (std::filesystem::exists(home_config, ec)) {
            return home_config;
        }
    }
    if (!cwd.empty()) {
        auto local_config = (std::filesystem::path(cwd) / kConfigFileName).string();
        if (std::filesystem::exists(local_config, ec)) {
            return local_config;
        }
    }
    return default_path;
}

std::string ResolveConfigPath(const std::optional<std::string>& explicit_path) {
    if (explicit_path.has_value()) {
        return *explicit_path;
    }

    const char* home_env = std::getenv("HOME");
    std::string home = home_env != nullptr ? home_env : "";

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        LogWarn("config", "Cannot determine working directory: " + ec.message());
    }

    return FindConfigPath(home, ec ? std::string() : cwd.string(),
                          MCP_RAILS_DEFAULT_CONFIG);
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeInvalid("missing 'server.name'"));
    }
    if (config.server.version.empty()) {
        return Result<void, Error>::Err(MakeInvalid("missing 'server.version'"));
    }

    std::vector<std::string> tool_names;
    for (size_t i = 0; i < config.tools.size(); ++i) {
        if (config.tools[i].name.empty()) {
            return Result<void, Error>::Err(MakeInvalid(
                "tool #" + std::to_string(i + 1) + " is missing 'name'"));
        }
        tool_names.push_back(config.tools[i].name);
    }

    std::vector<std::string> prompt_names;
    for (size_t i = 0; i < config.prompts.size(); ++i) {
        const auto& prompt = config.prompts[i];
        if (prompt.name.empty()) {
            return Result<void, Error>::Err(MakeInvalid(
                "prompt #" + std::to_string(i + 1) + " is missing 'name'"));
        }
        for (size_t j = 0; j < prompt.arguments.size(); ++j) {
            if (prompt.arguments[j].name.empty()) {
                return Result<void, Error>::Err(MakeInvalid(
                    "argument #" + std::to_string(j + 1) + " of prompt '" +
                    prompt.name + "' is missing 'name'"));
            }
        }
        prompt_names.push_back(prompt.name);
    }

    WarnOnDuplicates(tool_names, "tool");
    WarnOnDuplicates(prompt_names, "prompt");

    return Result<void, Error>::Ok();
}

} // namespace mcp_rails
