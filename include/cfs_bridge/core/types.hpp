#pragma once

#include <cfs_bridge/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cfs_bridge {

// Field limits of the MCP_INTERFACE request structure (NUL included).
constexpr std::size_t kMaxAppNameLen = 20;
constexpr std::size_t kMaxCommandNameLen = 32;
constexpr std::size_t kMaxParamsLen = 4096;

// ---------------------------------------------------------------------------
// AppName — validated cFS application name.
//
// Rules:
//   - Non-empty, shorter than kMaxAppNameLen (the endpoint stores it in a
//     fixed char[20])
//   - Printable ASCII only, no whitespace
// ---------------------------------------------------------------------------
class AppName {
public:
    static Result<AppName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const AppName& other) const { return value_ == other.value_; }
    bool operator!=(const AppName& other) const { return value_ != other.value_; }

private:
    explicit AppName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// CommandName — validated command mnemonic (e.g. NOOP, RESET_COUNTERS).
// Non-empty, shorter than kMaxCommandNameLen, printable ASCII, no whitespace.
// ---------------------------------------------------------------------------
class CommandName {
public:
    static Result<CommandName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const CommandName& other) const { return value_ == other.value_; }
    bool operator!=(const CommandName& other) const { return value_ != other.value_; }

private:
    explicit CommandName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// Endpoint — address of the remote flight-system endpoint.
//
// Accepted textual forms (Parse):
//   unix:/tmp/cfs_mcp.sock     Unix-domain stream socket
//   /tmp/cfs_mcp.sock          same, bare absolute path
//   tcp://localhost:8765       TCP stream socket
//   localhost:8765             same, without scheme
// ---------------------------------------------------------------------------
class Endpoint {
public:
    enum class Kind {
        UnixSocket,
        Tcp,
    };

    static Result<Endpoint, std::string> Unix(std::string_view path);
    static Result<Endpoint, std::string> Tcp(std::string_view host, int port);
    static Result<Endpoint, std::string> Parse(std::string_view spec);

    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }

    // "unix:<path>" or "tcp://<host>:<port>".
    [[nodiscard]] std::string ToString() const;

    bool operator==(const Endpoint& other) const {
        return kind_ == other.kind_ && path_ == other.path_ &&
               host_ == other.host_ && port_ == other.port_;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }

private:
    Endpoint(Kind kind, std::string path, std::string host, uint16_t port)
        : kind_(kind), path_(std::move(path)), host_(std::move(host)), port_(port) {}

    Kind kind_;
    std::string path_;
    std::string host_;
    uint16_t port_;
};

} // namespace cfs_bridge
