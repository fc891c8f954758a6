/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end emitting one JSON object
 * per line. Components tag their lines through a LogContext.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug" / "info" / "warn" / "error"; nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Escape a string for inclusion inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/// Extra key/value pairs attached to a single log line.
using LogFields = std::initializer_list<std::pair<std::string_view, std::string_view>>;

/**
 * @brief Thread-safe logger front-end.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void log(LogLevel level, std::string_view component,
             std::string_view message, LogFields fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

/**
 * @brief Logger view that stamps every line with a component name.
 */
class LogContext {
public:
    LogContext(Logger& logger, std::string component)
        : logger_(&logger), component_(std::move(component)) {}

    void debug(std::string_view message, LogFields fields = {}) {
        logger_->log(LogLevel::Debug, component_, message, fields);
    }
    void info(std::string_view message, LogFields fields = {}) {
        logger_->log(LogLevel::Info, component_, message, fields);
    }
    void warn(std::string_view message, LogFields fields = {}) {
        logger_->log(LogLevel::Warn, component_, message, fields);
    }
    void error(std::string_view message, LogFields fields = {}) {
        logger_->log(LogLevel::Error, component_, message, fields);
    }

private:
    Logger* logger_;
    std::string component_;
};

}  // namespace sandbox_orchestrator
