#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <string>

namespace sl {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Unrecognised names fall back to Info.
inline LogLevel parseLogLevel(const std::string &name) {
    if (name == "DEBUG" || name == "debug")
        return LogLevel::Debug;
    if (name == "WARN" || name == "warn")
        return LogLevel::Warn;
    if (name == "ERROR" || name == "error")
        return LogLevel::Error;
    return LogLevel::Info;
}

inline LogLevel &globalLogLevel() {
    static LogLevel level = [] {
        const char *env = std::getenv("SL_LOG_LEVEL");
        if (!env)
            return LogLevel::Info;
        return parseLogLevel(env);
    }();
    return level;
}

inline void setLogLevel(LogLevel level) { globalLogLevel() = level; }

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(globalLogLevel());
}

inline const char *levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

inline std::string currentTime() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T");
    return ss.str();
}

inline void log(LogLevel level, const std::string &msg,
                const char *file = nullptr, int line = 0,
                const char *component = nullptr) {
    if (!logEnabled(level))
        return;
    std::ostream &out = (level == LogLevel::Error ? std::cerr : std::cout);
    out << '[' << levelTag(level) << "] " << currentTime();
    if (file)
        out << ' ' << file << ':' << line;
    if (component)
        out << " [" << component << ']';
    out << " " << msg << std::endl;
}

} // namespace sl

#define SL_LOG(level, msg) ::sl::log(level, msg, __FILE__, __LINE__)
#define SL_LOG_TAG(level, tag, msg) ::sl::log(level, msg, __FILE__, __LINE__, tag)
