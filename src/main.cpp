#include <mcp_rails/config/config_loader.hpp>
#include <mcp_rails/core/log.hpp>
#include <mcp_rails/core/terminal.hpp>
#include <mcp_rails/core/version.hpp>
#include <mcp_rails/mcp/mcp_server.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

bool ResolveColor(mcp_rails::ColorMode mode) {
    switch (mode) {
        case mcp_rails::ColorMode::Always: return true;
        case mcp_rails::ColorMode::Never:  return false;
        case mcp_rails::ColorMode::Auto:   break;
    }
    return !mcp_rails::NoColorEnvSet() && mcp_rails::IsStderrTty();
}

// All diagnostics go to stderr; stdout belongs to the JSON-RPC stream.
void InitLogging(const mcp_rails::CliOptions& options) {
    using namespace mcp_rails;
    std::unique_ptr<ILogSink> sink;
    if (options.log_json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(ResolveColor(options.color), std::cerr);
    }
    InitGlobalLogger(std::move(sink), options.log_level);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_rails;

    // Step 1: Parse CLI args (argparse handles --help itself).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        std::cerr << "Error: " << cli_result.Error().ToString() << "\n";
        return cli_result.Error().ExitCode();
    }
    const auto options = std::move(cli_result).Value();

    if (options.show_version) {
        std::cout << "mcp-rails " << kVersion << "\n";
        return kExitSuccess;
    }

    // Step 2: Logging.
    InitLogging(options);

    // Step 3: Locate and load the catalog. Any failure here is fatal.
    const auto config_path = ResolveConfigPath(options.config_path);
    LogInfo("main", "Using config file " + config_path);

    auto config_result = LoadFromYaml(config_path);
    if (config_result.IsErr()) {
        LogError("main", config_result.Error().message);
        return config_result.Error().ExitCode();
    }

    // Step 4: Build the immutable context and serve until EOF.
    McpServerOptions server_options;
    server_options.echo_responses = options.echo_responses || McpDebugEnvSet();

    McpServer server(ServerContext::FromConfig(std::move(config_result).Value()),
                     std::cin, std::cout, server_options);
    server.Run();

    return kExitSuccess;
}
