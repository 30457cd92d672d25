#pragma once

#include <cfs_bridge/core/result.hpp>
#include <cfs_bridge/transport/i_transport.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// ConnectionState — lifecycle of the single stream connection.
//
//   Disconnected -> Connecting   first use
//   Connecting   -> Connected    open succeeded
//   Connecting   -> Disconnected retry budget exhausted / fatal connect error
//   Connected    -> Connecting   peer hung up between requests
//   Connected    -> Faulted      I/O error, timeout, malformed payload
//   Faulted      -> Connecting   next request rebuilds lazily
// ---------------------------------------------------------------------------
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Faulted,
};

[[nodiscard]] const char* ConnectionStateName(ConnectionState state);

struct ConnectionOptions {
    int max_attempts = 10;
    std::chrono::milliseconds retry_interval{2000};
    std::chrono::milliseconds read_timeout{5000};
};

// ---------------------------------------------------------------------------
// ConnectionManager — sole owner of the transport to the remote endpoint.
//
// EnsureConnected() opens lazily with a fixed retry budget. ECONNREFUSED and
// ENOENT (socket not created yet) are retried after `retry_interval`; any
// other failure stops the attempt loop at once. A connection the peer has
// hung up on since the last exchange is reopened here, before the next
// request is written. Send()/Receive() are the only path to the stream and
// do not change the state themselves: the Correlator calls MarkFaulted()
// after classifying a failure.
// ---------------------------------------------------------------------------
class ConnectionManager {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit ConnectionManager(std::unique_ptr<ITransport> transport,
                               ConnectionOptions options = {},
                               Sleeper sleeper = {});

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    [[nodiscard]] Result<void, Error> EnsureConnected();

    [[nodiscard]] Result<void, Error> Send(std::string_view bytes);
    [[nodiscard]] Result<std::string, Error> Receive(std::size_t max_bytes);

    // Close the resource and force Faulted so the next call reconnects.
    void MarkFaulted(std::string_view reason);

    // Close the resource and return to Disconnected (shutdown path).
    void Disconnect();

    [[nodiscard]] ConnectionState State() const noexcept { return state_; }
    [[nodiscard]] std::string EndpointName() const { return transport_->Describe(); }
    [[nodiscard]] const ConnectionOptions& Options() const noexcept { return options_; }

private:
    std::unique_ptr<ITransport> transport_;
    ConnectionOptions options_;
    Sleeper sleeper_;
    ConnectionState state_ = ConnectionState::Disconnected;
};

} // namespace cfs_bridge
