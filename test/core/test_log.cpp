#include <catch2/catch_test_macros.hpp>

#include <svn_bridge/core/log.hpp>

#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace svn_bridge;

namespace {

struct Captured {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<Captured>& out) : out_(out) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }
private:
    std::vector<Captured>& out_;
};

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

size_t CountLines(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (c == '\n') ++n;
    }
    return n;
}

} // anonymous namespace

// ===========================================================================
// Sinks
// ===========================================================================

TEST_CASE("JsonSink: writes one JSON line per message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Warn, "runner", "Killed: svn log");
    sink.Write(LogLevel::Info, "svn", "Nothing to commit");

    auto text = oss.str();
    CHECK(CountLines(text) == 2);
    CHECK(text.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(text.find("\"component\":\"runner\"") != std::string::npos);
    CHECK(text.find("\"message\":\"Killed: svn log\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Error, "parser", "bad \"quote\"\nnext");
    CHECK(oss.str().find(R"(bad \"quote\"\nnext)") != std::string::npos);
}

TEST_CASE("JsonSink: control character escape leaves stream fill unchanged", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Warn, "runner", std::string("bell\x07"));
    CHECK(oss.str().find("bell\\u0007") != std::string::npos);

    std::ostringstream padded;
    padded.copyfmt(oss);
    padded << std::setw(3) << 7;
    CHECK(padded.str() == "  7");
    CHECK(oss.fill() == ' ');
}

TEST_CASE("ColorConsoleSink: plain mode layout", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);
    sink.Write(LogLevel::Info, "svn", "hello");
    auto line = oss.str();
    CHECK(line.find("[INFO] [svn] hello") != std::string::npos);
    CHECK(line.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode contains ANSI escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);
    sink.Write(LogLevel::Error, "runner", "boom");
    auto line = oss.str();
    CHECK(line.find("\033[") != std::string::npos);
    CHECK(line.find("[runner]") != std::string::npos);
    CHECK(line.find("boom") != std::string::npos);
}

TEST_CASE("TeeSink: fans out to every sink", "[log]") {
    std::vector<Captured> a;
    std::vector<Captured> b;
    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::make_unique<CaptureSink>(a));
    sinks.push_back(std::make_unique<CaptureSink>(b));
    TeeSink tee(std::move(sinks));
    tee.Write(LogLevel::Warn, "svn", "SSL verification bypassed");
    REQUIRE(a.size() == 1);
    REQUIRE(b.size() == 1);
    CHECK(b[0].message == "SSL verification bypassed");
}

TEST_CASE("FileSink: unopenable path reports closed and drops writes", "[log]") {
    FileSink sink("/nonexistent-dir-for-svn-bridge/test.log");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "x", "y");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    std::vector<Captured> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);
    logger.Debug("c", "debug");
    logger.Info("c", "info");
    logger.Warn("c", "warn");
    logger.Error("c", "error");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].level == LogLevel::Warn);
    CHECK(lines[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    std::vector<Captured> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Error);
    logger.Info("c", "dropped");
    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Level() == LogLevel::Debug);
    logger.Debug("c", "kept");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].message == "kept");
}

TEST_CASE("Logger: concurrent logging keeps every line", "[log]") {
    std::ostringstream oss;
    Logger logger(std::make_unique<JsonSink>(oss), LogLevel::Debug);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < 50; ++i) {
                logger.Info("thread", std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(CountLines(oss.str()) == 200);
}

TEST_CASE("Global logger: LogWarn reaches the installed sink", "[log]") {
    std::vector<Captured> lines;
    InitGlobalLogger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);
    LogDebug("runner", "Running: svn status");
    LogWarn("svn", "warned");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].component == "runner");
    CHECK(lines[1].level == LogLevel::Warn);

    InitGlobalLogger(std::make_unique<DiscardSink>(), LogLevel::Error);
    LogWarn("svn", "not captured");
    CHECK(lines.size() == 2);
}

TEST_CASE("ParseLogLevel: names and fallback", "[log]") {
    CHECK(ParseLogLevel("DEBUG") == LogLevel::Debug);
    CHECK(ParseLogLevel("warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK(ParseLogLevel("chatty") == LogLevel::Info);
}
