/// @file log.hpp
/// @brief Leveled logging with a pluggable sink.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace topbase_cpp {

/// Severity of a log message, least severe first.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    off,  ///< Threshold only: suppresses everything.
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace:   return "trace";
        case LogLevel::debug:   return "debug";
        case LogLevel::info:    return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error:   return "error";
        case LogLevel::off:     return "off";
    }
    return "unknown";
}

/// Parse "trace", "debug", ... Returns nullopt for anything else.
auto log_level_from_string(std::string_view name) -> std::optional<LogLevel>;

/// Receives every message that passes the logger's threshold.
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// A sink writing "[level] message" lines to stderr.
auto stderr_sink() -> LogSink;

/// Leveled logger.
///
/// The library never prints on its own; every diagnostic goes through
/// a Logger the caller owns. Dry-run and verbose output are the
/// caller's choice of sink and threshold.
class Logger {
public:
    /// Log warnings and errors to stderr.
    Logger();

    /// Log to `sink` everything at or above `threshold`.
    explicit Logger(LogSink sink, LogLevel threshold = LogLevel::info);

    /// A logger that discards everything.
    static auto silent() -> Logger;

    auto threshold() const -> LogLevel { return threshold_; }
    void set_threshold(LogLevel level) { threshold_ = level; }

    /// Prepend `prefix` to every message (e.g. "   # " for dry runs).
    void set_prefix(std::string prefix) { prefix_ = std::move(prefix); }

    auto enabled(LogLevel level) const -> bool {
        return level != LogLevel::off && level >= threshold_ && static_cast<bool>(sink_);
    }

    void log(LogLevel level, std::string_view message) const;

    void trace(std::string_view message) const { log(LogLevel::trace, message); }
    void debug(std::string_view message) const { log(LogLevel::debug, message); }
    void info(std::string_view message) const { log(LogLevel::info, message); }
    void warn(std::string_view message) const { log(LogLevel::warning, message); }
    void error(std::string_view message) const { log(LogLevel::error, message); }

private:
    LogSink sink_;
    LogLevel threshold_;
    std::string prefix_;
};

}  // namespace topbase_cpp
