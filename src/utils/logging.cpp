#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <chrono>
#include <thread>
#include <fmt/chrono.h>

boost::optional<LogLevel> parseLogLevel(std::string_view raw) {
    std::string name{raw};
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return boost::none;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::write(LogLevel level, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto line = fmt::format("{:%H:%M:%S} [sparkbridge] [{}] {}\n",
                            fmt::localtime(std::chrono::system_clock::to_time_t(now)),
                            logLevelName(level), message);
    std::lock_guard lk{lck};
    std::fputs(line.c_str(), stderr);
}
