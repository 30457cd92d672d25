#pragma once

#include <cfs_bridge/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// ITransport — stream connection capability to the remote endpoint.
//
// The ConnectionManager is the only owner of a transport; the Correlator
// reaches the stream through the manager. This enables offline testing via
// SimulatedTransport and MockTransport.
//
// Methods return Result<T, Error> — never throw on expected failures.
// Open() failures carry sys_errno so the caller can tell retryable
// conditions (ECONNREFUSED, ENOENT) from fatal ones.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    // Establish a new connection. Any previously open resource is released
    // first. `read_timeout` bounds every subsequent Receive().
    [[nodiscard]] virtual Result<void, Error> Open(
        std::chrono::milliseconds read_timeout) = 0;

    // Write all bytes or fail.
    [[nodiscard]] virtual Result<void, Error> Send(std::string_view bytes) = 0;

    // Single read of at most max_bytes. An empty string means the peer
    // closed the stream. A timeout is an Err.
    [[nodiscard]] virtual Result<std::string, Error> Receive(
        std::size_t max_bytes) = 0;

    // Release the connection. Safe to call when already closed.
    virtual void Close() noexcept = 0;

    [[nodiscard]] virtual bool IsOpen() const noexcept = 0;

    // True when the connection is open but the peer has already hung up.
    // Checked before a request is written so a stale stream is replaced
    // instead of eating the request. Must not block or consume data.
    [[nodiscard]] virtual bool PeerClosed() noexcept = 0;

    // Human-readable endpoint name for logs and error reports.
    [[nodiscard]] virtual std::string Describe() const = 0;

protected:
    ITransport() = default;
};

} // namespace cfs_bridge
