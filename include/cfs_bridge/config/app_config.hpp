#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cfs_bridge {

inline constexpr const char* kDefaultSocketPath = "/tmp/cfs_mcp.sock";
inline constexpr uint16_t kDefaultTcpPort = 8765;

// Where the MCP_INTERFACE endpoint listens. Exactly one of socket_path and
// host is used: host wins when both are set.
struct EndpointConfig {
    std::string socket_path = kDefaultSocketPath;
    std::string host;
    uint16_t port = kDefaultTcpPort;
};

struct ConnectionTuning {
    int max_attempts = 10;
    int retry_interval_ms = 2000;
    int read_timeout_ms = 5000;
    int max_response_bytes = 4096;
};

struct AppConfig {
    EndpointConfig endpoint;
    ConnectionTuning connection;
    bool connect_on_startup = true;
    bool simulate = false;
    std::optional<std::string> log_file;
    bool json_logs = false;
    int verbosity = 0;               // 0 = warn, 1 = info, 2 = debug
    std::optional<bool> color;       // unset = auto-detect
    std::optional<std::string> config_file;
};

} // namespace cfs_bridge
