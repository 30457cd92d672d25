#pragma once

#include <cfs_bridge/bridge/connection_manager.hpp>
#include <cfs_bridge/core/result.hpp>
#include <cfs_bridge/protocol/envelope.hpp>

#include <cstddef>

namespace cfs_bridge {

inline constexpr std::size_t kDefaultMaxResponseBytes = 4096;

// ---------------------------------------------------------------------------
// Correlator — performs exactly one request/response exchange.
//
// Exchange():
//   1. EnsureConnected(), nothing is sent if that fails
//   2. write the encoded envelope whole
//   3. a single bounded read; zero bytes means the peer closed
//   4. decode, then require reply id == request id
//   5. status != 0 -> Application error, connection stays up
//
// Transport and Protocol failures fault the connection; the exchange itself
// is never retried, the next call reconnects.
// ---------------------------------------------------------------------------
class Correlator {
public:
    explicit Correlator(ConnectionManager& connection,
                        std::size_t max_response_bytes = kDefaultMaxResponseBytes);

    [[nodiscard]] Result<ResponseEnvelope, Error> Exchange(
        const RequestEnvelope& request);

private:
    // Log the error and fault the connection when its category requires it.
    Result<ResponseEnvelope, Error> Fail(Error error);

    ConnectionManager& connection_;
    std::size_t max_response_bytes_;
};

} // namespace cfs_bridge
