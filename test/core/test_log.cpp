#include <catch2/catch_test_macros.hpp>

#include <mcp_guard/core/log.hpp>

#include "../../test/mocks/capture_sink.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_guard;
using mcp_guard::testing::CapturedLog;
using mcp_guard::testing::CaptureSink;

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "protocol", "started");
    sink.Write(LogLevel::Warn, "rate_limit", "degraded");

    std::istringstream lines(oss.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0]["level"] == "INFO");
    CHECK(parsed[0]["component"] == "protocol");
    CHECK(parsed[0]["message"] == "started");
    CHECK(parsed[0].contains("ts"));
    CHECK(parsed[1]["level"] == "WARN");
}

TEST_CASE("JsonSink: fields are merged at top level", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.WriteFields(LogLevel::Warn, "security", "rate limit exceeded",
                     {{"source", "10.0.0.1"}, {"severity", "medium"}});

    auto line = nlohmann::json::parse(oss.str());
    CHECK(line["source"] == "10.0.0.1");
    CHECK(line["severity"] == "medium");
    CHECK(line["message"] == "rate limit exceeded");
}

TEST_CASE("JsonSink: reserved keys win over fields", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.WriteFields(LogLevel::Error, "security", "real message",
                     {{"message", "spoofed"}, {"level", "DEBUG"}});

    auto line = nlohmann::json::parse(oss.str());
    CHECK(line["message"] == "real message");
    CHECK(line["level"] == "ERROR");
}

TEST_CASE("JsonSink: invalid UTF-8 does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    CHECK_NOTHROW(sink.Write(LogLevel::Info, "x", std::string("bad \xff byte")));
    CHECK(oss.str().back() == '\n');
}

// ===========================================================================
// ILogSink default WriteFields
// ===========================================================================

TEST_CASE("ILogSink: plain sinks get fields appended to the message", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.WriteFields(LogLevel::Info, "security", "event", {{"source", "cli"}});

    auto output = oss.str();
    CHECK(output.find("[security]") != std::string::npos);
    CHECK(output.find("event {\"source\":\"cli\"}") != std::string::npos);
}

TEST_CASE("ILogSink: empty fields leave the message untouched", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.WriteFields(LogLevel::Info, "x", "bare", nlohmann::json::object());

    auto output = oss.str();
    CHECK(output.find("bare\n") != std::string::npos);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "http", "Listening on http://127.0.0.1:3000/mcp");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[http]") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: errors are colored twice", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "protocol", "Rate limiter failure");

    auto output = oss.str();
    auto first = output.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(output.find("\033[1;31m", first + 1) != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto log = std::make_shared<CapturedLog>();
    Logger logger(std::make_unique<CaptureSink>(log), LogLevel::Warn);

    logger.Debug("c", "filtered");
    logger.Info("c", "filtered");
    logger.Warn("c", "passes");
    logger.Error("c", "passes");

    auto messages = log->Snapshot();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel and Enabled", "[log]") {
    auto log = std::make_shared<CapturedLog>();
    Logger logger(std::make_unique<CaptureSink>(log), LogLevel::Error);

    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    logger.SetLevel(LogLevel::Info);
    CHECK(logger.Enabled(LogLevel::Info));
    CHECK_FALSE(logger.Enabled(LogLevel::Debug));
}

TEST_CASE("Logger: LogFields passes fields to the sink", "[log]") {
    auto log = std::make_shared<CapturedLog>();
    Logger logger(std::make_unique<CaptureSink>(log), LogLevel::Info);

    logger.LogFields(LogLevel::Warn, "security", "blocked", {{"source", "1.2.3.4"}});
    logger.LogFields(LogLevel::Debug, "security", "filtered", {{"x", 1}});

    auto messages = log->Snapshot();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].component == "security");
    CHECK(messages[0].fields["source"] == "1.2.3.4");
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto log = std::make_shared<CapturedLog>();
    Logger logger(std::make_unique<CaptureSink>(log), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t), "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(log->Snapshot().size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: helpers route to the installed sink", "[log]") {
    mcp_guard::testing::ScopedGlobalCapture capture(LogLevel::Info);

    LogDebug("main", "hidden");
    LogInfo("main", "starting");
    LogError("main", "failed");

    auto messages = capture.Log().Snapshot();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].message == "starting");
    CHECK(messages[1].level == LogLevel::Error);
}

TEST_CASE("LogLevelName: upper-case names", "[log]") {
    CHECK(std::string(LogLevelName(LogLevel::Debug)) == "DEBUG");
    CHECK(std::string(LogLevelName(LogLevel::Warn)) == "WARN");
}
