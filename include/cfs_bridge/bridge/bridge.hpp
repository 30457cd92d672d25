#pragma once

#include <cfs_bridge/bridge/connection_manager.hpp>
#include <cfs_bridge/bridge/correlator.hpp>
#include <cfs_bridge/core/result.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// Bridge — entry point for tool invocations.
//
// Invoke() runs the safety gate, encodes with a fresh id and performs one
// exchange. It returns the reply's "result" (null when the endpoint sent
// none). Ids start at 1, one is drawn per invocation that passes the gate,
// and they survive reconnects. No id is reused within one Bridge.
// ---------------------------------------------------------------------------
class Bridge {
public:
    Bridge(std::unique_ptr<ITransport> transport,
           ConnectionOptions options = {},
           std::size_t max_response_bytes = kDefaultMaxResponseBytes,
           ConnectionManager::Sleeper sleeper = {});

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    [[nodiscard]] Result<nlohmann::json, Error> Invoke(std::string_view tool_name,
                                                       const nlohmann::json& arguments);

    // Connect without sending anything (startup probe).
    [[nodiscard]] Result<void, Error> Connect() { return connection_.EnsureConnected(); }
    void Disconnect() { connection_.Disconnect(); }

    [[nodiscard]] uint64_t NextRequestId() { return next_id_.fetch_add(1); }

    [[nodiscard]] ConnectionState State() const noexcept { return connection_.State(); }
    [[nodiscard]] std::string EndpointName() const { return connection_.EndpointName(); }

private:
    ConnectionManager connection_;
    Correlator correlator_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace cfs_bridge
