#include <catch2/catch_test_macros.hpp>

#include <roadnet/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace roadnet;

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
        messages.push_back({level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// JsonSink / JsonFileSink
// ===========================================================================

TEST_CASE("JsonSink: writes one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "graph", "built graph");
    sink.Write(LogLevel::Warn, "graph", "duplicate edge key");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"component\":\"graph\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "schema", "column \"netw_id\"\ttab\nnext \\");

    auto output = oss.str();
    CHECK(output.find("column \\\"netw_id\\\"") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\\\") != std::string::npos);
}

TEST_CASE("JsonFileSink: appends lines to the file", "[log]") {
    auto path = (std::filesystem::temp_directory_path() / "roadnet_test_log.jsonl").string();
    std::remove(path.c_str());

    {
        JsonFileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "io", "loaded 3 road segments");
    }
    {
        JsonFileSink sink(path);
        sink.Write(LogLevel::Debug, "io", "second run");
    }

    std::ifstream in(path);
    std::string first, second;
    REQUIRE(std::getline(in, first));
    REQUIRE(std::getline(in, second));
    CHECK(first.find("loaded 3 road segments") != std::string::npos);
    CHECK(second.find("second run") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("JsonFileSink: unopenable path reports not open", "[log]") {
    JsonFileSink sink("/nonexistent-dir/roadnet/log.jsonl");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Info, "io", "dropped");
}

// ===========================================================================
// TeeSink
// ===========================================================================

TEST_CASE("TeeSink: forwards every message to all sinks in order", "[log]") {
    auto a = std::make_unique<CaptureSink>();
    auto b = std::make_unique<CaptureSink>();
    auto* a_ptr = a.get();
    auto* b_ptr = b.get();

    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(a));
    sinks.push_back(std::move(b));
    TeeSink tee(std::move(sinks));

    tee.Write(LogLevel::Warn, "graph", "w");
    tee.Write(LogLevel::Info, "graph", "i");

    REQUIRE(a_ptr->messages.size() == 2);
    REQUIRE(b_ptr->messages.size() == 2);
    CHECK(a_ptr->messages[0].message == "w");
    CHECK(b_ptr->messages[1].message == "i");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "filtered");
    logger.Info("c", "filtered");
    logger.Warn("c", "passes");
    logger.Error("c", "passes");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel and IsEnabled", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    CHECK_FALSE(logger.IsEnabled(LogLevel::Info));
    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    CHECK(logger.IsEnabled(LogLevel::Info));
    CHECK_FALSE(logger.IsEnabled(LogLevel::Debug));
    logger.Info("workflow", "graph ready");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "workflow");
    CHECK(sink_ptr->messages[0].message == "graph ready");
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 4;
    constexpr int kMessagesPerThread = 50;

    std::vector<std::thread> threads;
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

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "schema", "normalized 12 of 12 records");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[schema]") != std::string::npos);
    CHECK(output.find("normalized 12 of 12 records") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode colors errors red", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "workflow", "reduce failed");

    auto output = oss.str();
    auto first = output.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(output.find("\033[1;31m", first + 1) != std::string::npos);
    CHECK(output.back() == '\n');
}

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts names case-insensitively", "[log]") {
    LogLevel level = LogLevel::Error;
    REQUIRE(ParseLogLevel("DEBUG", level));
    CHECK(level == LogLevel::Debug);
    REQUIRE(ParseLogLevel("warning", level));
    CHECK(level == LogLevel::Warn);
    REQUIRE(ParseLogLevel("Info", level));
    CHECK(level == LogLevel::Info);
}

TEST_CASE("ParseLogLevel: rejects unknown names and leaves output alone", "[log]") {
    LogLevel level = LogLevel::Info;
    CHECK_FALSE(ParseLogLevel("verbose", level));
    CHECK(level == LogLevel::Info);
}
