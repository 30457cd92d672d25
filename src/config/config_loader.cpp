#include <cfs_bridge/config/config_loader.hpp>

#include <cfs_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <exception>

namespace cfs_bridge {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config, std::nullopt};
}

std::optional<std::string> StdGetenv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<uint16_t, Error> CheckPort(long long value, const std::string& source) {
    if (value < 1 || value > 65535) {
        return Result<uint16_t, Error>::Err(MakeConfigError(
            "Invalid " + source + ": " + std::to_string(value) +
            " (expected 1-65535)"));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

// Copy an endpoint spec ("unix:/p", "/p", "tcp://h:p", "h:p") into overrides.
Result<void, Error> ApplyEndpointSpec(const std::string& spec,
                                      const std::string& source,
                                      ConfigOverrides& out) {
    auto endpoint = Endpoint::Parse(spec);
    if (endpoint.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + endpoint.Error()));
    }
    const auto& ep = endpoint.Value();
    if (ep.GetKind() == Endpoint::Kind::UnixSocket) {
        out.socket_path = ep.Path();
        out.host.reset();
    } else {
        out.host = ep.Host();
        out.port = ep.Port();
        out.socket_path.reset();
    }
    return Result<void, Error>::Ok();
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (node[key]) {
        out = node[key].template as<T>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    ConfigOverrides config;
    try {
        // -- Endpoint --
        if (root["endpoint"]) {
            const auto& ep = root["endpoint"];
            ReadScalar(ep, "socket_path", config.socket_path);
            ReadScalar(ep, "host", config.host);
            if (ep["port"]) {
                auto port = CheckPort(ep["port"].as<long long>(), "endpoint.port");
                if (port.IsErr()) {
                    return Result<ConfigOverrides, Error>::Err(port.Error());
                }
                config.port = port.Value();
            }
        }

        // -- Connection --
        if (root["connection"]) {
            const auto& conn = root["connection"];
            ReadScalar(conn, "max_attempts", config.max_attempts);
            ReadScalar(conn, "retry_interval_ms", config.retry_interval_ms);
            ReadScalar(conn, "read_timeout_ms", config.read_timeout_ms);
            ReadScalar(conn, "max_response_bytes", config.max_response_bytes);
        }

        // -- Options --
        ReadScalar(root, "connect_on_startup", config.connect_on_startup);
        ReadScalar(root, "simulate", config.simulate);
        ReadScalar(root, "log_file", config.log_file);
        ReadScalar(root, "json_logs", config.json_logs);
        ReadScalar(root, "verbosity", config.verbosity);
        ReadScalar(root, "color", config.color);
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(MakeConfigError(
            "Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& getenv) {
    const EnvLookup lookup = getenv ? getenv : EnvLookup(&StdGetenv);
    ConfigOverrides config;

    if (auto path = lookup("CFS_SOCKET_PATH"); path && !path->empty()) {
        config.socket_path = *path;
    }
    if (auto host = lookup("CFS_HOST"); host && !host->empty()) {
        config.host = *host;
    }
    if (auto port = lookup("CFS_PORT"); port && !port->empty()) {
        long long value = 0;
        const auto* first = port->data();
        const auto* last = port->data() + port->size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Invalid CFS_PORT: '" + *port + "'"));
        }
        auto checked = CheckPort(value, "CFS_PORT");
        if (checked.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(checked.Error());
        }
        config.port = checked.Value();
    }
    if (auto file = lookup("CFS_BRIDGE_CONFIG"); file && !file->empty()) {
        config.config_file = *file;
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("cfs-bridge", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Bridge between MCP clients on stdin/stdout and the cFS MCP_INTERFACE "
        "application.");

    int verbosity = 0;

    // Endpoint flags
    program.add_argument("--socket")
        .help("Unix socket path of the cFS MCP interface");
    program.add_argument("--host")
        .help("TCP host of the cFS MCP interface");
    program.add_argument("--port")
        .help("TCP port of the cFS MCP interface")
        .scan<'i', int>();
    program.add_argument("--endpoint")
        .help("Endpoint as unix:/path or tcp://host:port");

    // Connection tuning
    program.add_argument("--retries")
        .help("Connection attempts before giving up")
        .scan<'i', int>();
    program.add_argument("--retry-interval")
        .help("Milliseconds between connection attempts")
        .scan<'i', int>();
    program.add_argument("--timeout")
        .help("Response timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--no-connect")
        .help("Do not probe the endpoint at startup")
        .default_value(false)
        .implicit_value(true);

    // Options
    program.add_argument("--simulate")
        .help("Answer requests from the built-in simulated endpoint")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--json-logs")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose logging (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    // Handled in main before parsing; declared so it shows in --help.
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ConfigOverrides config;

    // Endpoint
    if (auto val = program.present("--endpoint")) {
        auto applied = ApplyEndpointSpec(*val, "--endpoint", config);
        if (applied.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(applied.Error());
        }
    }
    if (auto val = program.present("--socket")) {
        config.socket_path = *val;
        config.host.reset();
    }
    if (auto val = program.present("--host")) {
        config.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = CheckPort(*val, "--port");
        if (port.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(port.Error());
        }
        config.port = port.Value();
    }

    // Connection
    if (auto val = program.present<int>("--retries")) {
        config.max_attempts = *val;
    }
    if (auto val = program.present<int>("--retry-interval")) {
        config.retry_interval_ms = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.read_timeout_ms = *val;
    }
    if (program.get<bool>("--no-connect")) {
        config.connect_on_startup = false;
    }

    // Options
    if (program.get<bool>("--simulate")) {
        config.simulate = true;
    }
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (verbosity > 0) {
        config.verbosity = verbosity;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides) {
    AppConfig merged = base;

    // Endpoint overrides
    if (overrides.host.has_value()) {
        merged.endpoint.host = *overrides.host;
    } else if (overrides.socket_path.has_value()) {
        merged.endpoint.socket_path = *overrides.socket_path;
        merged.endpoint.host.clear();
    }
    if (overrides.port.has_value()) {
        merged.endpoint.port = *overrides.port;
    }

    // Connection overrides
    if (overrides.max_attempts.has_value()) {
        merged.connection.max_attempts = *overrides.max_attempts;
    }
    if (overrides.retry_interval_ms.has_value()) {
        merged.connection.retry_interval_ms = *overrides.retry_interval_ms;
    }
    if (overrides.read_timeout_ms.has_value()) {
        merged.connection.read_timeout_ms = *overrides.read_timeout_ms;
    }
    if (overrides.max_response_bytes.has_value()) {
        merged.connection.max_response_bytes = *overrides.max_response_bytes;
    }

    // Options
    if (overrides.connect_on_startup.has_value()) {
        merged.connect_on_startup = *overrides.connect_on_startup;
    }
    if (overrides.simulate.has_value()) {
        merged.simulate = *overrides.simulate;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.json_logs.has_value()) {
        merged.json_logs = *overrides.json_logs;
    }
    if (overrides.verbosity.has_value()) {
        merged.verbosity = *overrides.verbosity;
    }
    if (overrides.color.has_value()) {
        merged.color = overrides.color;
    }
    if (overrides.config_file.has_value()) {
        merged.config_file = overrides.config_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv,
                                       const EnvLookup& getenv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Result<AppConfig, Error>::Err(cli.Error());
    }
    auto env = LoadFromEnv(getenv);
    if (env.IsErr()) {
        return Result<AppConfig, Error>::Err(env.Error());
    }

    std::optional<std::string> file = cli.Value().config_file;
    if (!file) {
        file = env.Value().config_file;
    }

    AppConfig config;
    if (file) {
        auto yaml = LoadFromYaml(*file);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(yaml.Error());
        }
        config = MergeConfigs(config, yaml.Value());
    }
    config = MergeConfigs(config, env.Value());
    config = MergeConfigs(config, cli.Value());
    config.config_file = file;

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& conn = config.connection;
    if (conn.max_attempts < 1) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid max_attempts: " + std::to_string(conn.max_attempts) +
            " (must be at least 1)"));
    }
    if (conn.retry_interval_ms < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid retry_interval_ms: " + std::to_string(conn.retry_interval_ms)));
    }
    if (conn.read_timeout_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid read_timeout_ms: " + std::to_string(conn.read_timeout_ms) +
            " (must be positive)"));
    }
    if (conn.max_response_bytes < 64) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid max_response_bytes: " + std::to_string(conn.max_response_bytes) +
            " (must be at least 64)"));
    }
    if (config.verbosity < 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid verbosity"));
    }
    if (!config.simulate) {
        auto endpoint = EndpointFromConfig(config);
        if (endpoint.IsErr()) {
            return Result<void, Error>::Err(endpoint.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<Endpoint, Error> EndpointFromConfig(const AppConfig& config) {
    auto endpoint = config.endpoint.host.empty()
                        ? Endpoint::Unix(config.endpoint.socket_path)
                        : Endpoint::Tcp(config.endpoint.host, config.endpoint.port);
    if (endpoint.IsErr()) {
        return Result<Endpoint, Error>::Err(
            MakeConfigError("Invalid endpoint: " + endpoint.Error()));
    }
    return Result<Endpoint, Error>::Ok(std::move(endpoint).Value());
}

} // namespace cfs_bridge
