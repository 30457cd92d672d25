#include <cfs_bridge/bridge/bridge.hpp>
#include <cfs_bridge/config/config_loader.hpp>
#include <cfs_bridge/core/log.hpp>
#include <cfs_bridge/core/terminal.hpp>
#include <cfs_bridge/core/version.hpp>
#include <cfs_bridge/mcp/cfs_tool_handlers.hpp>
#include <cfs_bridge/mcp/mcp_server.hpp>
#include <cfs_bridge/transport/simulated_transport.hpp>
#include <cfs_bridge/transport/socket_transport.hpp>

#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;
constexpr const char* kComponent = "main";

// Check for --version before any parsing.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "cfs-bridge " << cfs_bridge::kVersion << "\n";
            return true;
        }
    }
    return false;
}

cfs_bridge::LogLevel LevelFromVerbosity(int verbosity) {
    using cfs_bridge::LogLevel;
    if (verbosity >= 2) return LogLevel::Debug;
    if (verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

// Stdout carries the protocol: logs go to the file when one is configured,
// otherwise to stderr.
void InitLogging(const cfs_bridge::AppConfig& config) {
    using namespace cfs_bridge;

    const auto level = LevelFromVerbosity(config.verbosity);
    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file, config.json_logs);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), level);
            return;
        }
        std::cerr << "cfs-bridge: cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }
    if (config.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
        return;
    }
    const bool use_color = ResolveLogColor(config.color, IsStderrTty(), NoColorEnvSet());
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), level);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace cfs_bridge;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto resolved = ResolveConfig(argc, argv);
    if (resolved.IsErr()) {
        std::cerr << "cfs-bridge: " << resolved.Error().ToString() << "\n";
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    InitLogging(config);
    LogInfo(kComponent, std::string("cfs-bridge ") + kVersion + " starting");

    std::unique_ptr<ITransport> transport;
    if (config.simulate) {
        transport = std::make_unique<SimulatedTransport>();
    } else {
        auto endpoint = EndpointFromConfig(config);
        if (endpoint.IsErr()) {
            LogError(kComponent, endpoint.Error().ToString());
            return endpoint.Error().ExitCode();
        }
        transport = std::make_unique<SocketTransport>(endpoint.Value());
    }

    ConnectionOptions options;
    options.max_attempts = config.connection.max_attempts;
    options.retry_interval = std::chrono::milliseconds(config.connection.retry_interval_ms);
    options.read_timeout = std::chrono::milliseconds(config.connection.read_timeout_ms);

    Bridge bridge(std::move(transport), options,
                  static_cast<std::size_t>(config.connection.max_response_bytes));
    LogInfo(kComponent, "Endpoint: " + bridge.EndpointName());

    // A failed probe is not fatal: the first tool call connects again.
    if (config.connect_on_startup) {
        auto probe = bridge.Connect();
        if (probe.IsErr()) {
            LogWarn(kComponent,
                    "cFS not reachable at startup, will retry on first request: " +
                        probe.Error().message);
        }
    }

    ToolRegistry registry;
    RegisterCfsTools(registry, bridge);

    // Blocks until EOF on stdin.
    McpServer server(std::move(registry));
    server.Run();

    bridge.Disconnect();
    LogInfo(kComponent, "cfs-bridge stopped");
    return kExitSuccess;
}
