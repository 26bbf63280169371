/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lan_beacon {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += hex.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : shared_(std::make_shared<Shared>()) {
    shared_->sink = std::move(sink);
    shared_->min_level = min_level;
}

Logger::Logger(std::shared_ptr<Shared> shared, std::string component)
    : shared_(std::move(shared)), component_(std::move(component)) {}

Logger Logger::component(std::string name) const {
    return Logger(shared_, std::move(name));
}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    if (level < shared_->min_level.load()) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    ::gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z",)";
    if (!component_.empty()) {
        oss << R"("component":")" << json_escape(component_) << R"(",)";
    }
    oss << R"("msg":")" << json_escape(message) << R"("})";

    std::lock_guard lock(shared_->mutex);
    if (shared_->sink) shared_->sink->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(shared_->mutex);
    if (shared_->sink) shared_->sink->flush();
}

void Logger::set_level(LogLevel level) noexcept { shared_->min_level = level; }
LogLevel Logger::level() const noexcept { return shared_->min_level.load(); }

}  // namespace lan_beacon
