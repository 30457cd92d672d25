#include <cfs_bridge/bridge/correlator.hpp>

#include <cfs_bridge/core/log.hpp>

namespace cfs_bridge {

namespace {

constexpr const char* kComponent = "correlator";

} // anonymous namespace

Correlator::Correlator(ConnectionManager& connection, std::size_t max_response_bytes)
    : connection_(connection), max_response_bytes_(max_response_bytes) {}

Result<ResponseEnvelope, Error> Correlator::Fail(Error error) {
    if (error.endpoint.empty()) {
        error.endpoint = connection_.EndpointName();
    }
    if (error.FaultsConnection()) {
        LogError(kComponent, error.ToString());
        connection_.MarkFaulted(error.message);
    } else {
        LogWarn(kComponent, error.ToString());
    }
    return Result<ResponseEnvelope, Error>::Err(std::move(error));
}

Result<ResponseEnvelope, Error> Correlator::Exchange(const RequestEnvelope& request) {
    auto connected = connection_.EnsureConnected();
    if (connected.IsErr()) {
        return Result<ResponseEnvelope, Error>::Err(connected.Error());
    }

    const auto endpoint = connection_.EndpointName();
    const auto bytes = EncodeRequest(request);
    LogDebug(kComponent, "Sending request: " + bytes);

    auto sent = connection_.Send(bytes);
    if (sent.IsErr()) {
        return Fail(sent.Error());
    }

    auto received = connection_.Receive(max_response_bytes_);
    if (received.IsErr()) {
        return Fail(received.Error());
    }
    const auto& reply = received.Value();
    if (reply.empty()) {
        return Fail(Error{"Receive", endpoint, std::nullopt,
                           "cFS closed connection", std::nullopt,
                           ErrorCategory::Transport, std::nullopt});
    }
    LogDebug(kComponent, "Received response: " + reply);

    auto decoded = DecodeResponse(reply);
    if (decoded.IsErr()) {
        return Fail(decoded.Error());
    }
    auto response = std::move(decoded).Value();

    if (response.id != request.id) {
        return Fail(Error{"Exchange", endpoint, std::nullopt,
                           "Invalid response from cFS: id " +
                               std::to_string(response.id) +
                               " does not match request id " +
                               std::to_string(request.id),
                           std::nullopt, ErrorCategory::Protocol, std::nullopt});
    }

    if (!response.IsSuccess()) {
        return Fail(Error::FromRemoteStatus(OperationCodeName(request.type), endpoint,
                                            response.status, response.error));
    }

    return Result<ResponseEnvelope, Error>::Ok(std::move(response));
}

} // namespace cfs_bridge
