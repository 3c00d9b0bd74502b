#include <catch2/catch_test_macros.hpp>

#include <mcp_rails/mcp/content_resolver.hpp>

#include <string>

using namespace mcp_rails;

namespace {

AppConfig MakeTestConfig() {
    AppConfig config;
    config.server = {"TestRules", "1.2.3"};

    ToolConfig structured;
    structured.name = "rules";
    structured.description = "Structured rules";
    structured.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    structured.content.title = "Title";
    structured.content.intro = "Intro text.";
    structured.content.rules = {{"Alpha", "First."}, {"Beta", "Second."}};
    structured.content.footer = "Footer note";
    config.tools.push_back(structured);

    ToolConfig prerendered;
    prerendered.name = "prerendered";
    prerendered.description = "Markdown tool";
    prerendered.input_schema = nlohmann::json::object();
    prerendered.content.markdown = "# Ready";
    prerendered.content.title = "Ignored";
    config.tools.push_back(prerendered);

    PromptConfig review;
    review.name = "code_review";
    review.description = "Review code";
    review.arguments = {
        {"code", true, "The code"},
        {"focus_areas", false, "Focus"},
        {"language", false, "Language"},
        {"format", false, "Format"},
        {"audience", false, "Audience"},
    };
    review.template_text =
        "Review {{code}}"
        "{{#if focus_areas}} focusing on {{focus_areas}}{{/if}}"
        "{{#if language}} in {{language}}{{/if}}"
        " as {{format}}.";
    config.prompts.push_back(review);

    return config;
}

} // anonymous namespace

// ===========================================================================
// BuildMarkdownFromStructure
// ===========================================================================

TEST_CASE("BuildMarkdownFromStructure: full layout", "[mcp][content]") {
    ToolContent content;
    content.title = "Test Title";
    content.intro = "Test intro";
    content.rules = {{"Rule 1", "Description 1"}, {"Rule 2", "Description 2"}};
    content.footer = "Test footer";

    CHECK(BuildMarkdownFromStructure(content) ==
          "### Test Title\n"
          "\n"
          "Test intro\n"
          "\n"
          "1.  **Rule 1:** Description 1\n"
          "2.  **Rule 2:** Description 2\n"
          "\n"
          "---\n"
          "*Test footer*");
}

TEST_CASE("BuildMarkdownFromStructure: omitted parts add no lines", "[mcp][content]") {
    ToolContent rules_only;
    rules_only.rules = {{"Only", "Rule."}};
    CHECK(BuildMarkdownFromStructure(rules_only) == "1.  **Only:** Rule.");

    ToolContent title_only;
    title_only.title = "T";
    CHECK(BuildMarkdownFromStructure(title_only) == "### T\n");

    ToolContent footer_only;
    footer_only.footer = "F";
    CHECK(BuildMarkdownFromStructure(footer_only) == "\n---\n*F*");

    CHECK(BuildMarkdownFromStructure(ToolContent{}) == "");
}

// ===========================================================================
// ResolveTool
// ===========================================================================

TEST_CASE("ResolveTool: synthesizes markdown for structured content", "[mcp][content]") {
    auto config = MakeTestConfig();
    auto result = ResolveTool(config, "rules");
    REQUIRE(result.has_value());

    auto& content = (*result)["content"];
    REQUIRE(content.is_array());
    REQUIRE(content.size() == 1);
    CHECK(content[0]["type"] == "text");
    CHECK(content[0]["text"] ==
          BuildMarkdownFromStructure(config.tools[0].content));
}

TEST_CASE("ResolveTool: prefers pre-rendered markdown", "[mcp][content]") {
    auto config = MakeTestConfig();
    auto result = ResolveTool(config, "prerendered");
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "# Ready");
}

TEST_CASE("ResolveTool: unknown name returns nullopt", "[mcp][content]") {
    auto config = MakeTestConfig();
    CHECK_FALSE(ResolveTool(config, "nonexistent_tool").has_value());
}

TEST_CASE("ResolveTool: first definition wins for duplicate names", "[mcp][content]") {
    auto config = MakeTestConfig();
    ToolConfig shadow;
    shadow.name = "prerendered";
    shadow.content.markdown = "# Shadow";
    config.tools.push_back(shadow);

    auto result = ResolveTool(config, "prerendered");
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "# Ready");
}

// ===========================================================================
// Defaults
// ===========================================================================

TEST_CASE("DefaultValueFor: fixed table", "[mcp][content]") {
    CHECK(DefaultValueFor("focus_areas") == "general");
    CHECK(DefaultValueFor("language") == "auto-detect");
    CHECK(DefaultValueFor("format") == "markdown");
    CHECK(DefaultValueFor("code") == "");
    CHECK(DefaultValueFor("Language") == "");
}

TEST_CASE("ApplyArgumentDefaults: fills missing and null arguments only", "[mcp][content]") {
    auto config = MakeTestConfig();
    const auto& prompt = config.prompts[0];

    Variables supplied = {
        {"code", "x = 1"},
        {"language", nullptr},
        {"format", "plain"},
        {"extra", "kept"},
    };
    auto vars = ApplyArgumentDefaults(prompt, supplied);

    CHECK(vars["code"] == "x = 1");
    CHECK(vars["focus_areas"] == "general");
    CHECK(vars["language"] == "auto-detect");
    CHECK(vars["format"] == "plain");
    CHECK(vars["audience"] == "");
    CHECK(vars["extra"] == "kept");
}

// ===========================================================================
// ResolvePrompt
// ===========================================================================

TEST_CASE("ResolvePrompt: wraps rendered text as a user message", "[mcp][content]") {
    auto config = MakeTestConfig();
    auto result = ResolvePrompt(config, "code_review", {{"code", "class Test; end"}});
    REQUIRE(result.has_value());

    auto& messages = (*result)["messages"];
    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["role"] == "user");
    CHECK(messages[0]["content"]["type"] == "text");
    CHECK(messages[0]["content"]["text"] == "Review class Test; end as markdown.");
}

TEST_CASE("ResolvePrompt: omitted optional args never trigger conditionals", "[mcp][content]") {
    auto config = MakeTestConfig();
    auto result = ResolvePrompt(config, "code_review", {});
    REQUIRE(result.has_value());
    CHECK((*result)["messages"][0]["content"]["text"] == "Review  as markdown.");
}

TEST_CASE("ResolvePrompt: supplied args enable conditionals", "[mcp][content]") {
    auto config = MakeTestConfig();
    Variables args = {
        {"code", "def x; end"},
        {"focus_areas", "security"},
        {"language", "Ruby"},
        {"format", "a list"},
    };
    auto result = ResolvePrompt(config, "code_review", args);
    REQUIRE(result.has_value());
    CHECK((*result)["messages"][0]["content"]["text"] ==
          "Review def x; end focusing on security in Ruby as a list.");
}

TEST_CASE("ResolvePrompt: unknown name returns nullopt", "[mcp][content]") {
    auto config = MakeTestConfig();
    CHECK_FALSE(ResolvePrompt(config, "nonexistent_prompt", {}).has_value());
}

// ===========================================================================
// Catalog construction
// ===========================================================================

TEST_CASE("BuildServerManifest: identity and tool descriptors in order", "[mcp][content]") {
    auto manifest = BuildServerManifest(MakeTestConfig());
    CHECK(manifest.name == "TestRules");
    CHECK(manifest.version == "1.2.3");
    REQUIRE(manifest.tools.size() == 2);
    CHECK(manifest.tools[0].name == "rules");
    CHECK(manifest.tools[1].name == "prerendered");

    auto json = ToJson(manifest.tools[0]);
    CHECK(json["name"] == "rules");
    CHECK(json["description"] == "Structured rules");
    CHECK(json["inputSchema"]["type"] == "object");
    CHECK_FALSE(json.contains("content"));
}

TEST_CASE("BuildPromptCatalog: descriptors without templates", "[mcp][content]") {
    auto prompts = BuildPromptCatalog(MakeTestConfig());
    REQUIRE(prompts.size() == 1);

    auto json = ToJson(prompts[0]);
    CHECK(json["name"] == "code_review");
    CHECK(json["description"] == "Review code");
    CHECK_FALSE(json.contains("template"));
    REQUIRE(json["arguments"].size() == 5);
    CHECK(json["arguments"][0]["name"] == "code");
    CHECK(json["arguments"][0]["required"] == true);
    CHECK(json["arguments"][1]["required"] == false);
}
