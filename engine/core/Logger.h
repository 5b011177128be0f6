// Console logger with a runtime level filter and optional file mirror.
#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace Engine {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
    // Mirrors every accepted line into the given file (appends). Empty path disables the mirror.
    static bool setLogFile(const std::string& path);

    static bool parseLevel(std::string_view text, LogLevel& out);
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Engine
