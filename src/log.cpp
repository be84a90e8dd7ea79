#include <topbase-cpp/log.hpp>

#include <cstdio>
#include <string>

namespace topbase_cpp {

auto log_level_from_string(std::string_view name) -> std::optional<LogLevel> {
    for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info,
                       LogLevel::warning, LogLevel::error, LogLevel::off}) {
        if (to_string_view(level) == name) return level;
    }
    if (name == "warn") return LogLevel::warning;
    return std::nullopt;
}

auto stderr_sink() -> LogSink {
    return [](LogLevel level, std::string_view message) {
        const auto tag = to_string_view(level);
        std::fprintf(stderr, "[%.*s] %.*s\n",
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    };
}

Logger::Logger() : sink_{stderr_sink()}, threshold_{LogLevel::warning} {}

Logger::Logger(LogSink sink, LogLevel threshold)
    : sink_{std::move(sink)}, threshold_{threshold} {}

auto Logger::silent() -> Logger {
    return Logger{LogSink{}, LogLevel::off};
}

void Logger::log(LogLevel level, std::string_view message) const {
    if (!enabled(level)) return;
    if (prefix_.empty()) {
        sink_(level, message);
    } else {
        sink_(level, prefix_ + std::string{message});
    }
}

}  // namespace topbase_cpp
