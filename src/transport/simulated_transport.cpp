#include <cfs_bridge/transport/simulated_transport.hpp>

#include <cfs_bridge/bridge/request_encoder.hpp>
#include <cfs_bridge/core/log.hpp>

#include <chrono>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

namespace {

constexpr const char* kComponent = "simulator";

int64_t WallClockSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

Error NotConnected(const std::string& operation) {
    return Error{operation, "simulated", std::nullopt, "Not connected",
                 std::nullopt, ErrorCategory::Transport, std::nullopt};
}

ResponseEnvelope Reject(uint64_t id, int64_t now, const std::string& message) {
    ResponseEnvelope response;
    response.id = id;
    response.status = -1;
    response.error = message;
    response.timestamp = now;
    return response;
}

} // anonymous namespace

SimulatedTransport::SimulatedTransport(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(&WallClockSeconds)) {}

Result<void, Error> SimulatedTransport::Open(std::chrono::milliseconds /*read_timeout*/) {
    Close();
    if (refuse_remaining_ > 0) {
        --refuse_remaining_;
        return Result<void, Error>::Err(Error::FromErrno(
            "Connect", "simulated", "connect() failed", refuse_errno_));
    }
    // A hang-up lasts for one connection only.
    if (exchanges_before_close_.has_value() && *exchanges_before_close_ <= 0) {
        exchanges_before_close_.reset();
    }
    open_ = true;
    ++open_count_;
    return Result<void, Error>::Ok();
}

Result<void, Error> SimulatedTransport::Send(std::string_view bytes) {
    if (!open_) {
        return Result<void, Error>::Err(NotConnected("Send"));
    }

    if (exchanges_before_close_.has_value() && *exchanges_before_close_ <= 0) {
        // Peer is gone; the write is swallowed and the read sees EOF.
        pending_.push_back("");
        return Result<void, Error>::Ok();
    }

    const auto now = clock_();
    auto decoded = DecodeRequest(bytes);
    if (decoded.IsErr()) {
        // Mirror the endpoint: unparseable requests and unknown types get a
        // status -1 reply rather than a dropped connection.
        auto raw = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
        uint64_t id = 0;
        if (raw.is_object() && raw.contains("id") && raw["id"].is_number_unsigned()) {
            id = raw["id"].get<uint64_t>();
        }
        std::string message = "Invalid JSON request";
        if (raw.is_object() && raw.contains("type") && raw["type"].is_number_integer()) {
            message = "Unknown request type: " + std::to_string(raw["type"].get<int64_t>());
        }
        pending_.push_back(EncodeResponse(Reject(id, now, message)));
    } else {
        const auto& request = decoded.Value();
        requests_.push_back(request);
        pending_.push_back(EncodeResponse(Answer(request)));
        LogDebug(kComponent, std::string("Answered ") +
                                 OperationCodeName(request.type) + " id=" +
                                 std::to_string(request.id));
    }

    if (exchanges_before_close_.has_value()) {
        --*exchanges_before_close_;
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> SimulatedTransport::Receive(std::size_t max_bytes) {
    if (!open_) {
        return Result<std::string, Error>::Err(NotConnected("Receive"));
    }
    if (pending_.empty()) {
        return Result<std::string, Error>::Err(
            Error{"Receive", "simulated", std::nullopt,
                  "Timeout waiting for cFS response", std::nullopt,
                  ErrorCategory::Transport, std::nullopt});
    }
    auto bytes = std::move(pending_.front());
    pending_.pop_front();
    if (bytes.size() > max_bytes) {
        bytes.resize(max_bytes);
    }
    return Result<std::string, Error>::Ok(std::move(bytes));
}

bool SimulatedTransport::PeerClosed() noexcept {
    return open_ && exchanges_before_close_.has_value() && *exchanges_before_close_ <= 0;
}

void SimulatedTransport::Close() noexcept {
    open_ = false;
    pending_.clear();
}

void SimulatedTransport::RefuseNextConnects(int count, int errnum) {
    refuse_remaining_ = count;
    refuse_errno_ = errnum;
}

void SimulatedTransport::CloseAfterExchanges(int count) {
    exchanges_before_close_ = count;
}

ResponseEnvelope SimulatedTransport::Answer(const RequestEnvelope& request) const {
    const auto now = clock_();
    nlohmann::json result;

    switch (request.type) {
        case OperationCode::SendCommand:
            result = {
                {"command_sent", true},
                {"app", request.target},
                {"command", request.command},
                {"status", "success"},
                {"message", "Simulated command " + request.command + " sent to " +
                                request.target}};
            break;

        case OperationCode::GetTelemetry:
            result = {
                {"app_name", request.target.empty() ? "MCP_INTERFACE" : request.target},
                {"timestamp", now},
                {"telemetry", {
                    {"cmd_counter", 42},
                    {"err_counter", 0},
                    {"active_clients", 1},
                    {"system_status", "OPERATIONAL"},
                    {"health", "NOMINAL"}}}};
            break;

        case OperationCode::GetSystemStatus:
            result = {
                {"system_status", {
                    {"timestamp", now},
                    {"cfs_version", "cFE 7.0 (Simulated)"},
                    {"applications", {
                        {"CFE_ES", "RUNNING"},
                        {"CFE_EVS", "RUNNING"},
                        {"CFE_SB", "RUNNING"},
                        {"FM", "RUNNING"},
                        {"HK", "RUNNING"},
                        {"MCP_INTERFACE", "RUNNING"}}},
                    {"memory_usage", "45%"},
                    {"cpu_usage", "12%"},
                    {"system_health", "NOMINAL"}}}};
            break;

        case OperationCode::ManageApplication: {
            auto decoded = DecodeQuotedParam(request.params);
            if (decoded.IsErr()) {
                return Reject(request.id, now, decoded.Error().message);
            }
            const auto action = std::move(decoded).Value();
            const bool known = action == "status" || action == "start" ||
                               action == "stop" || action == "restart";
            result = {
                {"app_management", {
                    {"app", request.target},
                    {"action", action},
                    {"status", known ? "success" : "error"},
                    {"message", "Simulated " + action + " operation on " +
                                    request.target}}}};
            break;
        }

        case OperationCode::ListFiles: {
            // An absent param means the default directory.
            std::string directory = kDefaultDirectory;
            if (!request.params.empty()) {
                auto decoded = DecodeQuotedParam(request.params);
                if (decoded.IsErr()) {
                    return Reject(request.id, now, decoded.Error().message);
                }
                directory = std::move(decoded).Value();
            }
            result = {
                {"directory", directory},
                {"files", nlohmann::json::array({
                    {{"name", "test_file.txt"}, {"size", 1024}, {"type", "file"}},
                    {{"name", "config"}, {"size", 0}, {"type", "directory"}},
                    {{"name", "logs"}, {"size", 0}, {"type", "directory"}},
                    {{"name", "data.bin"}, {"size", 2048}, {"type", "file"}}})}};
            break;
        }

        case OperationCode::ReadFile: {
            auto decoded = DecodeQuotedParam(request.params);
            if (decoded.IsErr()) {
                return Reject(request.id, now, decoded.Error().message);
            }
            const auto path = std::move(decoded).Value();
            result = {
                {"file_path", path},
                {"size", 256},
                {"content", "Simulated file content for " + path +
                                "\nThis is a test file.\n"}};
            break;
        }

        case OperationCode::GetEventLog:
            result = {
                {"event_log", {
                    {"timestamp", now},
                    {"recent_events", nlohmann::json::array({
                        {{"id", 1}, {"app", "MCP_INTERFACE"}, {"type", "INFO"},
                         {"time", now - 60}, {"message", "MCP Interface started"}},
                        {{"id", 2}, {"app", "CFE_ES"}, {"type", "INFO"},
                         {"time", now - 30}, {"message", "Application status nominal"}}})}}}};
            break;

        case OperationCode::EmergencyStop:
            result = {
                {"emergency_stop", {
                    {"timestamp", now},
                    {"status", "executed"},
                    {"actions", nlohmann::json::array(
                        {"safe_mode_enabled", "non_essential_apps_stopped"})},
                    {"message", "Simulated emergency stop executed"}}}};
            break;
    }

    ResponseEnvelope response;
    response.id = request.id;
    response.status = 0;
    response.result = result.dump();
    response.timestamp = now;
    return response;
}

} // namespace cfs_bridge
