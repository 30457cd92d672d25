#pragma once

#include <cfs_bridge/protocol/envelope.hpp>
#include <cfs_bridge/transport/i_transport.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// SimulatedTransport — in-memory stand-in for the MCP_INTERFACE endpoint.
//
// Every Send() is decoded and answered with a canned, deterministic reply
// (given a fixed clock) that the next Receive() returns. Replies carry the
// result as a string holding serialized JSON, like the flight software does.
//
// Failure injection:
//   RefuseNextConnects(n)   the next n Open() calls fail with `errnum`
//   CloseAfterExchanges(n)  after n answered requests the peer hangs up:
//                           PeerClosed() turns true, and a request written
//                           anyway is swallowed and read back as "" (EOF)
// ---------------------------------------------------------------------------
class SimulatedTransport : public ITransport {
public:
    using Clock = std::function<int64_t()>;

    explicit SimulatedTransport(Clock clock = {});

    [[nodiscard]] Result<void, Error> Open(
        std::chrono::milliseconds read_timeout) override;
    [[nodiscard]] Result<void, Error> Send(std::string_view bytes) override;
    [[nodiscard]] Result<std::string, Error> Receive(std::size_t max_bytes) override;
    void Close() noexcept override;
    [[nodiscard]] bool IsOpen() const noexcept override { return open_; }
    [[nodiscard]] bool PeerClosed() noexcept override;
    [[nodiscard]] std::string Describe() const override { return "simulated"; }

    void RefuseNextConnects(int count, int errnum);
    void CloseAfterExchanges(int count);

    [[nodiscard]] int OpenCount() const noexcept { return open_count_; }
    [[nodiscard]] const std::vector<RequestEnvelope>& Requests() const noexcept {
        return requests_;
    }

    // Build the reply for one request; exposed for tests and reuse.
    [[nodiscard]] ResponseEnvelope Answer(const RequestEnvelope& request) const;

private:
    Clock clock_;
    bool open_ = false;
    int open_count_ = 0;
    int refuse_remaining_ = 0;
    int refuse_errno_ = 0;
    std::optional<int> exchanges_before_close_;
    std::deque<std::string> pending_;
    std::vector<RequestEnvelope> requests_;
};

} // namespace cfs_bridge
