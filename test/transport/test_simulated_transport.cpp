#include <catch2/catch_test_macros.hpp>

#include <cfs_bridge/bridge/request_encoder.hpp>
#include <cfs_bridge/transport/simulated_transport.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <string>

using namespace cfs_bridge;

namespace {

constexpr auto kTimeout = std::chrono::milliseconds(100);
constexpr int64_t kFixedTime = 1700000000;

SimulatedTransport MakeTransport() {
    return SimulatedTransport([] { return kFixedTime; });
}

ResponseEnvelope RoundTrip(SimulatedTransport& transport, const RequestEnvelope& request) {
    REQUIRE(transport.Send(EncodeRequest(request)).IsOk());
    auto bytes = transport.Receive(4096);
    REQUIRE(bytes.IsOk());
    auto decoded = DecodeResponse(bytes.Value());
    REQUIRE(decoded.IsOk());
    return decoded.Value();
}

} // anonymous namespace

TEST_CASE("SimulatedTransport: telemetry reply has cmd_counter 42", "[transport][simulated]") {
    SimulatedTransport transport([] { return kFixedTime; });
    REQUIRE(transport.Open(kTimeout).IsOk());

    RequestEnvelope request;
    request.id = 11;
    request.type = OperationCode::GetTelemetry;
    request.target = "MCP_INTERFACE";

    auto response = RoundTrip(transport, request);
    CHECK(response.id == 11);
    CHECK(response.status == 0);
    CHECK(response.timestamp == kFixedTime);
    REQUIRE(response.result.has_value());
    CHECK((*response.result)["telemetry"]["cmd_counter"] == 42);
    CHECK((*response.result)["timestamp"] == kFixedTime);
}

TEST_CASE("SimulatedTransport: result travels as a JSON string", "[transport][simulated]") {
    SimulatedTransport transport([] { return kFixedTime; });
    REQUIRE(transport.Open(kTimeout).IsOk());

    RequestEnvelope request;
    request.id = 1;
    request.type = OperationCode::GetSystemStatus;
    REQUIRE(transport.Send(EncodeRequest(request)).IsOk());
    auto bytes = transport.Receive(4096);
    REQUIRE(bytes.IsOk());

    auto raw = nlohmann::json::parse(bytes.Value());
    CHECK(raw["result"].is_string());
}

TEST_CASE("SimulatedTransport: replies for every operation", "[transport][simulated]") {
    SimulatedTransport transport([] { return kFixedTime; });
    REQUIRE(transport.Open(kTimeout).IsOk());

    RequestEnvelope request;
    request.id = 1;

    request.type = OperationCode::ListFiles;
    request.params = "\"/cf/logs\"";
    auto listing = RoundTrip(transport, request);
    CHECK((*listing.result)["directory"] == "/cf/logs");
    CHECK((*listing.result)["files"].size() == 4);

    request.id = 2;
    request.type = OperationCode::ReadFile;
    request.params = "\"/cf/test_file.txt\"";
    auto file = RoundTrip(transport, request);
    CHECK((*file.result)["file_path"] == "/cf/test_file.txt");

    request.id = 3;
    request.type = OperationCode::ManageApplication;
    request.target = "FM";
    request.params = "\"restart\"";
    auto managed = RoundTrip(transport, request);
    CHECK((*managed.result)["app_management"]["action"] == "restart");
    CHECK((*managed.result)["app_management"]["status"] == "success");

    request.id = 4;
    request.type = OperationCode::GetEventLog;
    auto events = RoundTrip(transport, request);
    CHECK((*events.result)["event_log"]["recent_events"].size() == 2);

    request.id = 5;
    request.type = OperationCode::EmergencyStop;
    auto stop = RoundTrip(transport, request);
    CHECK((*stop.result)["emergency_stop"]["status"] == "executed");

    CHECK(transport.Requests().size() == 5);
}

TEST_CASE("SimulatedTransport: unknown type gets status -1", "[transport][simulated]") {
    auto transport = MakeTransport();
    REQUIRE(transport.Open(kTimeout).IsOk());

    REQUIRE(transport.Send(R"({"id":4,"type":6,"app_name":"","command":"","params":""})").IsOk());
    auto bytes = transport.Receive(4096);
    REQUIRE(bytes.IsOk());
    auto response = DecodeResponse(bytes.Value());
    REQUIRE(response.IsOk());
    CHECK(response.Value().id == 4);
    CHECK(response.Value().status == -1);
    CHECK(response.Value().error == "Unknown request type: 6");
}

TEST_CASE("SimulatedTransport: invalid JSON gets status -1", "[transport][simulated]") {
    auto transport = MakeTransport();
    REQUIRE(transport.Open(kTimeout).IsOk());

    REQUIRE(transport.Send("not json").IsOk());
    auto response = DecodeResponse(transport.Receive(4096).Value());
    REQUIRE(response.IsOk());
    CHECK(response.Value().status == -1);
    CHECK(response.Value().error == "Invalid JSON request");
}

TEST_CASE("SimulatedTransport: Receive without a request times out", "[transport][simulated]") {
    auto transport = MakeTransport();
    REQUIRE(transport.Open(kTimeout).IsOk());
    auto r = transport.Receive(4096);
    REQUIRE(r.IsErr());
    CHECK(r.Error().IsTransport());
}

TEST_CASE("SimulatedTransport: I/O before Open fails", "[transport][simulated]") {
    auto transport = MakeTransport();
    CHECK_FALSE(transport.IsOpen());
    CHECK(transport.Send("{}").IsErr());
    CHECK(transport.Receive(16).IsErr());
}

TEST_CASE("SimulatedTransport: RefuseNextConnects fails with errno", "[transport][simulated]") {
    auto transport = MakeTransport();
    transport.RefuseNextConnects(2, ECONNREFUSED);

    auto first = transport.Open(kTimeout);
    REQUIRE(first.IsErr());
    CHECK(first.Error().sys_errno == ECONNREFUSED);
    CHECK(transport.Open(kTimeout).IsErr());
    CHECK(transport.Open(kTimeout).IsOk());
    CHECK(transport.OpenCount() == 1);
}

TEST_CASE("SimulatedTransport: CloseAfterExchanges reports the hang-up",
          "[transport][simulated]") {
    auto transport = MakeTransport();
    transport.CloseAfterExchanges(1);
    REQUIRE(transport.Open(kTimeout).IsOk());
    CHECK_FALSE(transport.PeerClosed());

    RequestEnvelope request;
    request.id = 1;
    request.type = OperationCode::GetEventLog;
    RoundTrip(transport, request);
    CHECK(transport.PeerClosed());
    CHECK(transport.IsOpen());

    // A request written anyway is lost and the read sees EOF.
    request.id = 2;
    REQUIRE(transport.Send(EncodeRequest(request)).IsOk());
    auto eof = transport.Receive(4096);
    REQUIRE(eof.IsOk());
    CHECK(eof.Value().empty());

    // A fresh connection is healthy again.
    REQUIRE(transport.Open(kTimeout).IsOk());
    CHECK_FALSE(transport.PeerClosed());
    request.id = 3;
    auto response = RoundTrip(transport, request);
    CHECK(response.id == 3);
    CHECK_FALSE(transport.PeerClosed());
}

TEST_CASE("SimulatedTransport: quoted params are decoded, escapes included",
          "[transport][simulated]") {
    auto transport = MakeTransport();
    REQUIRE(transport.Open(kTimeout).IsOk());
    const std::string tricky = "/cf/a\"b\\c.txt";

    RequestEnvelope read;
    read.id = 1;
    read.type = OperationCode::ReadFile;
    read.params = QuoteParam(tricky);
    auto file = RoundTrip(transport, read);
    REQUIRE(file.result.has_value());
    CHECK((*file.result)["file_path"] == tricky);

    RequestEnvelope list;
    list.id = 2;
    list.type = OperationCode::ListFiles;
    list.params = QuoteParam(tricky);
    auto listing = RoundTrip(transport, list);
    REQUIRE(listing.result.has_value());
    CHECK((*listing.result)["directory"] == tricky);
}

TEST_CASE("SimulatedTransport: unquoted params get status -1", "[transport][simulated]") {
    auto transport = MakeTransport();
    REQUIRE(transport.Open(kTimeout).IsOk());

    RequestEnvelope request;
    request.id = 4;
    request.type = OperationCode::ManageApplication;
    request.target = "FM";
    request.params = "restart";

    auto response = RoundTrip(transport, request);
    CHECK(response.id == 4);
    CHECK(response.status == -1);
    REQUIRE(response.error.has_value());
    CHECK(*response.error == "Params are not a quoted string: restart");
}
