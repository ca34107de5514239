#ifndef SPARKBRIDGE_LOGGING_HPP
#define SPARKBRIDGE_LOGGING_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <boost/optional.hpp>
#include <fmt/format.h>

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

boost::optional<LogLevel> parseLogLevel(std::string_view name);
const char* logLevelName(LogLevel level);

/// Process-wide line logger writing to stderr.
struct Logger {
    std::atomic<LogLevel> threshold{LogLevel::Info};
    std::mutex lck;

    static Logger& instance();

    void setLevel(LogLevel level) {
        threshold.store(level);
    }
    LogLevel level() const {
        return threshold.load();
    }
    bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= threshold.load();
    }

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    void write(LogLevel level, std::string_view message);
};

#define SPARKBRIDGE_LOG_TRACE(...) ::Logger::instance().log(LogLevel::Trace, __VA_ARGS__)
#define SPARKBRIDGE_LOG_DEBUG(...) ::Logger::instance().log(LogLevel::Debug, __VA_ARGS__)
#define SPARKBRIDGE_LOG_INFO(...) ::Logger::instance().log(LogLevel::Info, __VA_ARGS__)
#define SPARKBRIDGE_LOG_WARN(...) ::Logger::instance().log(LogLevel::Warn, __VA_ARGS__)
#define SPARKBRIDGE_LOG_ERROR(...) ::Logger::instance().log(LogLevel::Error, __VA_ARGS__)

#endif //SPARKBRIDGE_LOGGING_HPP
