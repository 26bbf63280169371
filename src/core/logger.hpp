/**
 * @file logger.hpp
 * @brief Logging front-end with pluggable sinks.
 *
 * Records are rendered as single-line JSON objects and handed to an
 * ILogSink. Sinks use virtual dispatch since they are chosen at startup
 * from configuration.
 *
 *   {"level":"info","ts":"2024-05-01T10:00:00.123Z","component":"discovery","msg":"..."}
 *
 * A Logger may hand out component loggers that share its sink and level,
 * so the daemon configures output once and each subsystem tags its own
 * records.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lan_beacon {

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

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// ILogSink
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

/**
 * @brief Thread-safe logger front-end.
 *
 * Copies and component loggers share the sink and the minimum level;
 * set_level() on any of them affects all.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    /// Logger writing to the same sink with `name` in the component field.
    [[nodiscard]] Logger component(std::string name) const;
    [[nodiscard]] const std::string& component_name() const noexcept { return component_; }

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    struct Shared {
        std::unique_ptr<ILogSink> sink;
        std::atomic<LogLevel> min_level;
        std::mutex mutex;
    };

    Logger(std::shared_ptr<Shared> shared, std::string component);

    std::shared_ptr<Shared> shared_;
    std::string component_;
};

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace lan_beacon
