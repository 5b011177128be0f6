#include "Logger.h"

#include <atomic>
#include <cctype>
#include <fstream>
#include <mutex>

namespace Engine {

namespace {
std::string_view toLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

// Dial and receive threads log too; one lock keeps lines whole.
std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

std::ofstream& fileSink() {
    static std::ofstream f;
    return f;
}

std::atomic<int> gMinLevel{static_cast<int>(LogLevel::Info)};
}  // namespace

void Logger::log(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    if (static_cast<int>(level) < gMinLevel.load()) {
        return;
    }

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << "] ["
        << toLabel(level) << "] " << message << '\n';

    std::scoped_lock lk(sinkMutex());
    std::cout << oss.str();
    auto& file = fileSink();
    if (file.is_open()) {
        file << oss.str();
        file.flush();
    }
}

void Logger::setMinLevel(LogLevel level) { gMinLevel = static_cast<int>(level); }

LogLevel Logger::minLevel() { return static_cast<LogLevel>(gMinLevel.load()); }

bool Logger::setLogFile(const std::string& path) {
    std::scoped_lock lk(sinkMutex());
    auto& file = fileSink();
    if (file.is_open()) {
        file.close();
    }
    if (path.empty()) {
        return true;
    }
    file.open(path, std::ios::app);
    return file.is_open();
}

bool Logger::parseLevel(std::string_view text, LogLevel& out) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") {
        out = LogLevel::Debug;
    } else if (lower == "info") {
        out = LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::Warning;
    } else if (lower == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

}  // namespace Engine
