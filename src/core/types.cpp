#include <cfs_bridge/core/types.hpp>

#include <algorithm>
#include <charconv>

#include <sys/un.h>

namespace cfs_bridge {

namespace {

bool IsPrintableToken(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return c > 0x20 && c < 0x7f;
    });
}

Result<std::string, std::string> ValidateToken(std::string_view value,
                                               std::string_view what,
                                               std::size_t max_len) {
    if (value.empty()) {
        return Result<std::string, std::string>::Err(
            std::string(what) + " must not be empty");
    }
    if (value.size() >= max_len) {
        return Result<std::string, std::string>::Err(
            std::string(what) + " must be shorter than " +
            std::to_string(max_len) + " characters, got " +
            std::to_string(value.size()));
    }
    if (!IsPrintableToken(value)) {
        return Result<std::string, std::string>::Err(
            std::string(what) +
            " must contain only printable ASCII characters without spaces");
    }
    return Result<std::string, std::string>::Ok(std::string(value));
}

constexpr std::size_t kUnixPathMax = sizeof(sockaddr_un{}.sun_path);

} // anonymous namespace

// ---------------------------------------------------------------------------
// AppName
// ---------------------------------------------------------------------------
Result<AppName, std::string> AppName::Create(std::string_view name) {
    auto checked = ValidateToken(name, "Application name", kMaxAppNameLen);
    if (checked.IsErr()) {
        return Result<AppName, std::string>::Err(checked.Error());
    }
    return Result<AppName, std::string>::Ok(AppName(std::move(checked).Value()));
}

// ---------------------------------------------------------------------------
// CommandName
// ---------------------------------------------------------------------------
Result<CommandName, std::string> CommandName::Create(std::string_view name) {
    auto checked = ValidateToken(name, "Command name", kMaxCommandNameLen);
    if (checked.IsErr()) {
        return Result<CommandName, std::string>::Err(checked.Error());
    }
    return Result<CommandName, std::string>::Ok(
        CommandName(std::move(checked).Value()));
}

// ---------------------------------------------------------------------------
// Endpoint
// ---------------------------------------------------------------------------
Result<Endpoint, std::string> Endpoint::Unix(std::string_view path) {
    if (path.empty()) {
        return Result<Endpoint, std::string>::Err("Socket path must not be empty");
    }
    if (path.size() >= kUnixPathMax) {
        return Result<Endpoint, std::string>::Err(
            "Socket path must be shorter than " + std::to_string(kUnixPathMax) +
            " characters");
    }
    return Result<Endpoint, std::string>::Ok(
        Endpoint(Kind::UnixSocket, std::string(path), "", 0));
}

Result<Endpoint, std::string> Endpoint::Tcp(std::string_view host, int port) {
    if (host.empty()) {
        return Result<Endpoint, std::string>::Err("Host must not be empty");
    }
    if (port <= 0 || port > 65535) {
        return Result<Endpoint, std::string>::Err(
            "Port must be in 1..65535, got " + std::to_string(port));
    }
    return Result<Endpoint, std::string>::Ok(
        Endpoint(Kind::Tcp, "", std::string(host), static_cast<uint16_t>(port)));
}

Result<Endpoint, std::string> Endpoint::Parse(std::string_view spec) {
    constexpr std::string_view kUnixScheme = "unix:";
    constexpr std::string_view kTcpScheme = "tcp://";

    if (spec.substr(0, kUnixScheme.size()) == kUnixScheme) {
        return Unix(spec.substr(kUnixScheme.size()));
    }
    if (!spec.empty() && spec[0] == '/') {
        return Unix(spec);
    }

    auto rest = spec;
    if (rest.substr(0, kTcpScheme.size()) == kTcpScheme) {
        rest = rest.substr(kTcpScheme.size());
    }
    auto colon = rest.rfind(':');
    if (colon == std::string_view::npos) {
        return Result<Endpoint, std::string>::Err(
            "Endpoint must be a socket path or host:port, got '" +
            std::string(spec) + "'");
    }
    auto port_text = rest.substr(colon + 1);
    int port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(),
                                     port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size()) {
        return Result<Endpoint, std::string>::Err(
            "Invalid port in endpoint '" + std::string(spec) + "'");
    }
    return Tcp(rest.substr(0, colon), port);
}

std::string Endpoint::ToString() const {
    if (kind_ == Kind::UnixSocket) {
        return "unix:" + path_;
    }
    return "tcp://" + host_ + ":" + std::to_string(port_);
}

} // namespace cfs_bridge
