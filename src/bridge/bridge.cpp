#include <cfs_bridge/bridge/bridge.hpp>

#include <cfs_bridge/bridge/request_encoder.hpp>
#include <cfs_bridge/bridge/safety_gate.hpp>

namespace cfs_bridge {

Bridge::Bridge(std::unique_ptr<ITransport> transport,
               ConnectionOptions options,
               std::size_t max_response_bytes,
               ConnectionManager::Sleeper sleeper)
    : connection_(std::move(transport), options, std::move(sleeper)),
      correlator_(connection_, max_response_bytes) {}

Result<nlohmann::json, Error> Bridge::Invoke(std::string_view tool_name,
                                             const nlohmann::json& arguments) {
    auto authorized = AuthorizeInvocation(tool_name, arguments);
    if (authorized.IsErr()) {
        return Result<nlohmann::json, Error>::Err(authorized.Error());
    }

    auto request = EncodeInvocation(tool_name, arguments, NextRequestId());
    if (request.IsErr()) {
        return Result<nlohmann::json, Error>::Err(request.Error());
    }

    auto response = correlator_.Exchange(request.Value());
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(response.Error());
    }
    return Result<nlohmann::json, Error>::Ok(
        response.Value().result.value_or(nlohmann::json()));
}

} // namespace cfs_bridge
