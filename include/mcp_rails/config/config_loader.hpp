#pragma once

#include <mcp_rails/config/app_config.hpp>
#include <mcp_rails/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcp_rails {

// File name looked up in $HOME and in the working directory.
constexpr const char* kConfigFileName = ".mcp_rails.yml";

// Parse a YAML catalog file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse a YAML catalog from an in-memory document.
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml_text);

// Parse CLI arguments into CliOptions.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Pick the catalog file: <home>/.mcp_rails.yml, then <cwd>/.mcp_rails.yml,
// then default_path. An empty home is skipped. Existence is not checked for
// the default.
std::string FindConfigPath(const std::string& home, const std::string& cwd,
                           const std::string& default_path);

// An explicit path always wins; otherwise FindConfigPath() with $HOME, the
// current directory and the build-time default catalog.
std::string ResolveConfigPath(const std::optional<std::string>& explicit_path);

// Presence checks only: server identity, tool and prompt names, argument names.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_rails
