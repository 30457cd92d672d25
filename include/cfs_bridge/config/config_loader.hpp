#pragma once

#include <cfs_bridge/config/app_config.hpp>
#include <cfs_bridge/core/result.hpp>
#include <cfs_bridge/core/types.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cfs_bridge {

// Partial configuration from one source. Unset fields leave the lower
// layer untouched when merged.
struct ConfigOverrides {
    std::optional<std::string> socket_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<int> max_attempts;
    std::optional<int> retry_interval_ms;
    std::optional<int> read_timeout_ms;
    std::optional<int> max_response_bytes;
    std::optional<bool> connect_on_startup;
    std::optional<bool> simulate;
    std::optional<std::string> log_file;
    std::optional<bool> json_logs;
    std::optional<int> verbosity;
    std::optional<bool> color;
    std::optional<std::string> config_file;
};

// Parse a YAML config file.
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path);

// Read CFS_SOCKET_PATH, CFS_HOST, CFS_PORT and CFS_BRIDGE_CONFIG.
// `getenv` is injectable for tests; defaults to std::getenv.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& getenv = {});

// Parse command-line flags.
Result<ConfigOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply `overrides` on top of `base`. A host override selects TCP; a
// socket_path override selects the Unix socket.
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides);

// Resolve defaults < YAML < environment < CLI. The YAML file is taken from
// --config, else from CFS_BRIDGE_CONFIG; without either no file is read.
Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv,
                                       const EnvLookup& getenv = {});

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Endpoint described by a validated config.
Result<Endpoint, Error> EndpointFromConfig(const AppConfig& config);

} // namespace cfs_bridge
