/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * ILogSink is a virtual interface for runtime-configurable destinations;
 * Logger is the thread-safe front-end that formats NDJSON lines. Solvers
 * take a nullable Logger* and use log_to() so a missing logger costs nothing.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace uras {

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

/// Parse "debug" / "info" / "warn" / "error"; unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Each line has the shape
 * {"level":"info","ts":"2026-01-01T00:00:00.000Z","component":"ga","msg":"..."}.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warn(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void log(LogLevel level, std::string_view component, std::string_view message);
    void flush();

    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= min_level_; }

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

/// Log through an optional logger.
inline void log_to(Logger* logger, LogLevel level,
                   std::string_view component, std::string_view message) {
    if (logger != nullptr) logger->log(level, component, message);
}

}  // namespace uras
