/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"

#include "core/concepts.hpp"

#include <chrono>
#include <cstdio>
#include <sstream>

namespace sandbox_orchestrator {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    log(level, {}, message);
}

void Logger::log(LogLevel level, std::string_view component,
                 std::string_view message, LogFields fields) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")" << format_iso8601(std::chrono::system_clock::now()) << R"(",)";
    if (!component.empty()) {
        oss << R"("component":")" << json_escape(component) << R"(",)";
    }
    oss << R"("msg":")" << json_escape(message) << '"';
    for (const auto& [key, value] : fields) {
        oss << R"(,")" << json_escape(key) << R"(":")" << json_escape(value) << '"';
    }
    oss << '}';

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_.store(level); }
LogLevel Logger::level() const noexcept { return min_level_.load(); }

}  // namespace sandbox_orchestrator
