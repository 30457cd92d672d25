#include <cfs_bridge/bridge/connection_manager.hpp>

#include <cfs_bridge/core/log.hpp>

#include <cerrno>
#include <thread>

namespace cfs_bridge {

namespace {

constexpr const char* kComponent = "connection";

bool IsRetryableConnectError(const Error& error) {
    return error.sys_errno.has_value() &&
           (*error.sys_errno == ECONNREFUSED || *error.sys_errno == ENOENT);
}

void SleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

} // anonymous namespace

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Faulted:      return "faulted";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(std::unique_ptr<ITransport> transport,
                                     ConnectionOptions options,
                                     Sleeper sleeper)
    : transport_(std::move(transport)),
      options_(options),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(&SleepFor)) {}

Result<void, Error> ConnectionManager::EnsureConnected() {
    if (state_ == ConnectionState::Connected && transport_->IsOpen()) {
        if (!transport_->PeerClosed()) {
            return Result<void, Error>::Ok();
        }
        // Nothing has been written yet, so replacing the stream is safe.
        LogInfo(kComponent, "cFS closed the connection, reconnecting");
        transport_->Close();
    }

    state_ = ConnectionState::Connecting;
    const auto endpoint = transport_->Describe();
    const int max_attempts = options_.max_attempts > 0 ? options_.max_attempts : 1;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto opened = transport_->Open(options_.read_timeout);
        if (opened.IsOk()) {
            state_ = ConnectionState::Connected;
            LogInfo(kComponent, "Connected to cFS at " + endpoint);
            return Result<void, Error>::Ok();
        }

        const auto& error = opened.Error();
        if (!IsRetryableConnectError(error)) {
            transport_->Close();
            state_ = ConnectionState::Disconnected;
            LogError(kComponent, "Error connecting to cFS: " + error.ToString());
            return Result<void, Error>::Err(Error{
                "Connect", endpoint, std::nullopt,
                "Cannot connect to cFS MCP Interface: " + error.message,
                std::nullopt, ErrorCategory::Transport, error.sys_errno});
        }

        if (attempt < max_attempts) {
            LogInfo(kComponent, "cFS socket not ready, retrying in " +
                                    std::to_string(options_.retry_interval.count()) +
                                    " ms... (" + std::to_string(attempt) + "/" +
                                    std::to_string(max_attempts) + ")");
            sleeper_(options_.retry_interval);
        }
    }

    transport_->Close();
    state_ = ConnectionState::Disconnected;
    LogError(kComponent, "Failed to connect to cFS after " +
                             std::to_string(max_attempts) + " attempts");
    return Result<void, Error>::Err(Error{
        "Connect", endpoint, std::nullopt,
        "Cannot connect to cFS MCP Interface after " +
            std::to_string(max_attempts) + " attempts",
        std::nullopt, ErrorCategory::Transport, std::nullopt});
}

Result<void, Error> ConnectionManager::Send(std::string_view bytes) {
    return transport_->Send(bytes);
}

Result<std::string, Error> ConnectionManager::Receive(std::size_t max_bytes) {
    return transport_->Receive(max_bytes);
}

void ConnectionManager::MarkFaulted(std::string_view reason) {
    transport_->Close();
    state_ = ConnectionState::Faulted;
    LogWarn(kComponent, "Connection faulted, will reconnect on next request: " +
                            std::string(reason));
}

void ConnectionManager::Disconnect() {
    transport_->Close();
    state_ = ConnectionState::Disconnected;
}

} // namespace cfs_bridge
