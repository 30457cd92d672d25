#include <catch2/catch_test_macros.hpp>

#include <cfs_bridge/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace cfs_bridge;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names case-insensitively", "[log]") {
    LogLevel level = LogLevel::Error;
    CHECK(ParseLogLevel("DEBUG", level));
    CHECK(level == LogLevel::Debug);
    CHECK(ParseLogLevel("warning", level));
    CHECK(level == LogLevel::Warn);
}

TEST_CASE("ParseLogLevel: unknown name leaves level untouched", "[log]") {
    LogLevel level = LogLevel::Info;
    CHECK_FALSE(ParseLogLevel("verbose", level));
    CHECK(level == LogLevel::Info);
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "connection", "Connected to cFS");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"connection\"") != std::string::npos);
    CHECK(line.find("\"message\":\"Connected to cFS\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
    CHECK(std::count(output.begin(), output.end(), '\n') == 1);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Warn, "correlator", "Timeout waiting for cFS response");

    auto output = oss.str();
    CHECK(output.find("[WARN]") != std::string::npos);
    CHECK(output.find("[correlator]") != std::string::npos);
    CHECK(output.find("Timeout waiting for cFS response") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode contains ANSI escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "connection", "Failed to connect");

    auto output = oss.str();
    CHECK(output.find("\033[") != std::string::npos);
    CHECK(output.find("Failed to connect") != std::string::npos);
    CHECK(output.back() == '\n');
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends lines to the file", "[log]") {
    const std::string path =
        "/tmp/cfs_bridge_log_test_" + std::to_string(::getpid()) + ".log";
    std::remove(path.c_str());
    {
        FileSink sink(path, false);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "main", "first");
        sink.Write(LogLevel::Error, "main", "second");
    }
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    CHECK(content.find("[main] first") != std::string::npos);
    CHECK(content.find("[ERROR]") != std::string::npos);
    CHECK(std::count(content.begin(), content.end(), '\n') == 2);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unwritable path reports not open", "[log]") {
    FileSink sink("/nonexistent-dir/cfs_bridge.log", true);
    CHECK_FALSE(sink.IsOpen());
    // Writing to a closed sink is a no-op.
    sink.Write(LogLevel::Info, "main", "dropped");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: concurrent logging does not crash", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: free functions route to the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("safety", "filtered");
    LogWarn("safety", "Emergency stop rejected");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "safety");

    // Leave a quiet logger behind for other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
