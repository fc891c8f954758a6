/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger, the log sinks, and MetricsCollector.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace sandbox_orchestrator;

namespace {

struct CapturingLogger {
    MemorySink* sink;
    Logger logger;

    explicit CapturingLogger(LogLevel level = LogLevel::Debug)
        : CapturingLogger(std::make_unique<MemorySink>(), level) {}

private:
    CapturingLogger(std::unique_ptr<MemorySink> owned, LogLevel level)
        : sink(owned.get()), logger(std::move(owned), level) {}
};

}  // namespace

// ═══════════════════════════════════════════════
// Logger
// ═══════════════════════════════════════════════

TEST(LoggerTest, EmitsOneJsonObjectPerLine) {
    CapturingLogger capture;
    capture.logger.info("hello");

    auto lines = capture.sink->lines();
    ASSERT_EQ(lines.size(), 1u);
    auto line = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(line["level"], "info");
    EXPECT_EQ(line["msg"], "hello");
    EXPECT_TRUE(line.contains("ts"));
    EXPECT_FALSE(line.contains("component"));
}

TEST(LoggerTest, TimestampIsIsoUtcWithMillis) {
    CapturingLogger capture;
    capture.logger.warn("x");
    auto ts = nlohmann::json::parse(capture.sink->lines()[0])["ts"].get<std::string>();
    // 2026-01-01T00:00:00.000Z
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[19], '.');
    EXPECT_EQ(ts.back(), 'Z');
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    CapturingLogger capture(LogLevel::Warn);
    capture.logger.debug("d");
    capture.logger.info("i");
    capture.logger.warn("w");
    capture.logger.error("e");
    EXPECT_EQ(capture.sink->lines().size(), 2u);

    capture.logger.set_level(LogLevel::Debug);
    capture.logger.debug("d");
    EXPECT_EQ(capture.sink->lines().size(), 3u);
}

TEST(LoggerTest, ContextAddsComponentAndFields) {
    CapturingLogger capture;
    LogContext log(capture.logger, "warm_pool");
    log.info("Instance created", {{"instance", "sbx-1"}, {"note", "line\nbreak \"quoted\""}});

    auto line = nlohmann::json::parse(capture.sink->lines()[0]);
    EXPECT_EQ(line["component"], "warm_pool");
    EXPECT_EQ(line["instance"], "sbx-1");
    EXPECT_EQ(line["note"], "line\nbreak \"quoted\"");
}

TEST(LoggerTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(json_escape("a\"b"), "a\\\"b");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(json_escape("tab\there"), "tab\\there");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

// ═══════════════════════════════════════════════
// JsonFileSink
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "so_test_json_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static size_t line_count(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        std::string line;
        while (std::getline(in, line)) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, WritesNdjson) {
    {
        JsonFileSink sink(dir_, "test");
        ASSERT_TRUE(sink.is_open());
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
    }
    EXPECT_EQ(line_count(dir_ / "test.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesBySizeKeepingMaxFiles) {
    JsonFileSink sink(dir_, "rot", 1, 2);
    sink.set_max_file_size_bytes(20);

    for (int i = 0; i < 10; ++i) {
        sink.write(R"({"line":")" + std::to_string(i) + R"(xxxx"})");
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(dir_ / "rot.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "rot.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "rot.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "rot.3.ndjson"));
}

// ═══════════════════════════════════════════════
// MetricsCollector
// ═══════════════════════════════════════════════

TEST(MetricsCollectorTest, ExecutionEvent) {
    auto owned = std::make_unique<MemorySink>();
    auto* sink = owned.get();
    MetricsCollector metrics(std::move(owned));

    ExecutionRecord record;
    record.id = "exec-7";
    record.agent_id = "agent-a";
    record.status = ExecutionStatus::Completed;
    record.retry_count = 1;
    auto now = std::chrono::system_clock::now();
    record.started_at = now;
    record.completed_at = now + std::chrono::milliseconds(40);
    metrics.record_execution_event(record);

    auto event = nlohmann::json::parse(sink->lines().at(0));
    EXPECT_EQ(event["event"], "execution_state_change");
    EXPECT_EQ(event["execution"], "exec-7");
    EXPECT_EQ(event["status"], "completed");
    EXPECT_EQ(event["attempt"], 2);
    EXPECT_EQ(event["duration_ms"], 40);
}

TEST(MetricsCollectorTest, PoolAndRateLimitEvents) {
    auto owned = std::make_unique<MemorySink>();
    auto* sink = owned.get();
    MetricsCollector metrics(std::move(owned));

    metrics.record_pool_event("sbx-3", "instance_discarded", "unhealthy");
    metrics.record_rate_limited("user-1", "ai");

    auto pool = nlohmann::json::parse(sink->lines().at(0));
    EXPECT_EQ(pool["event"], "pool_instance_discarded");
    EXPECT_EQ(pool["detail"], "unhealthy");

    auto limited = nlohmann::json::parse(sink->lines().at(1));
    EXPECT_EQ(limited["event"], "rate_limited");
    EXPECT_EQ(limited["identity"], "user-1");
    EXPECT_EQ(limited["route"], "ai");
}
