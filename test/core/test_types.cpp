#include <catch2/catch_test_macros.hpp>

#include <cfs_bridge/core/types.hpp>

#include <string>

using namespace cfs_bridge;

// ===========================================================================
// AppName
// ===========================================================================

TEST_CASE("AppName: accepts typical cFS application names", "[types]") {
    for (const char* name : {"CFE_ES", "MCP_INTERFACE", "FM", "HK"}) {
        auto r = AppName::Create(name);
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == name);
    }
}

TEST_CASE("AppName: rejects empty name", "[types]") {
    auto r = AppName::Create("");
    REQUIRE(r.IsErr());
    CHECK(r.Error().find("empty") != std::string::npos);
}

TEST_CASE("AppName: 19 characters fit, 20 do not", "[types]") {
    CHECK(AppName::Create(std::string(19, 'A')).IsOk());
    auto r = AppName::Create(std::string(20, 'A'));
    REQUIRE(r.IsErr());
    CHECK(r.Error().find("shorter than 20") != std::string::npos);
}

TEST_CASE("AppName: rejects whitespace and control characters", "[types]") {
    CHECK(AppName::Create("CFE ES").IsErr());
    CHECK(AppName::Create("CFE\tES").IsErr());
    CHECK(AppName::Create("CFE\nES").IsErr());
}

// ===========================================================================
// CommandName
// ===========================================================================

TEST_CASE("CommandName: 31 characters fit, 32 do not", "[types]") {
    CHECK(CommandName::Create("NOOP").IsOk());
    CHECK(CommandName::Create(std::string(31, 'X')).IsOk());
    CHECK(CommandName::Create(std::string(32, 'X')).IsErr());
}

// ===========================================================================
// Endpoint
// ===========================================================================

TEST_CASE("Endpoint: Parse unix: scheme", "[types][endpoint]") {
    auto r = Endpoint::Parse("unix:/tmp/cfs_mcp.sock");
    REQUIRE(r.IsOk());
    CHECK(r.Value().GetKind() == Endpoint::Kind::UnixSocket);
    CHECK(r.Value().Path() == "/tmp/cfs_mcp.sock");
    CHECK(r.Value().ToString() == "unix:/tmp/cfs_mcp.sock");
}

TEST_CASE("Endpoint: Parse bare absolute path", "[types][endpoint]") {
    auto r = Endpoint::Parse("/var/run/cfs.sock");
    REQUIRE(r.IsOk());
    CHECK(r.Value().GetKind() == Endpoint::Kind::UnixSocket);
}

TEST_CASE("Endpoint: Parse tcp:// and host:port", "[types][endpoint]") {
    auto a = Endpoint::Parse("tcp://localhost:8765");
    REQUIRE(a.IsOk());
    CHECK(a.Value().GetKind() == Endpoint::Kind::Tcp);
    CHECK(a.Value().Host() == "localhost");
    CHECK(a.Value().Port() == 8765);

    auto b = Endpoint::Parse("10.0.0.5:9000");
    REQUIRE(b.IsOk());
    CHECK(b.Value().ToString() == "tcp://10.0.0.5:9000");
}

TEST_CASE("Endpoint: Parse rejects bad ports and missing port", "[types][endpoint]") {
    CHECK(Endpoint::Parse("localhost").IsErr());
    CHECK(Endpoint::Parse("localhost:0").IsErr());
    CHECK(Endpoint::Parse("localhost:70000").IsErr());
    CHECK(Endpoint::Parse("localhost:12ab").IsErr());
    CHECK(Endpoint::Parse(":8765").IsErr());
}

TEST_CASE("Endpoint: Unix rejects paths longer than sun_path", "[types][endpoint]") {
    CHECK(Endpoint::Unix("").IsErr());
    CHECK(Endpoint::Unix("/" + std::string(200, 'a')).IsErr());
}

TEST_CASE("Endpoint: equality", "[types][endpoint]") {
    CHECK(Endpoint::Tcp("h", 1).Value() == Endpoint::Parse("h:1").Value());
    CHECK(Endpoint::Tcp("h", 1).Value() != Endpoint::Tcp("h", 2).Value());
}
