#include "util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

namespace codegym {

namespace {

LogLevel initialLevel() {
    const char* env = std::getenv("CODEGYM_LOG_LEVEL");
    return env ? parseLogLevel(env) : LogLevel::Info;
}

std::atomic<int>& levelStorage() {
    static std::atomic<int> level{static_cast<int>(initialLevel())};
    return level;
}

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "OFF";
    }
}

std::mutex& writeMutex() {
    static std::mutex m;
    return m;
}

} // namespace

void setLogLevel(LogLevel level) {
    levelStorage().store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(levelStorage().load());
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return LogLevel::Info;
}

bool logEnabled(LogLevel level) {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= levelStorage().load();
}

void logWrite(LogLevel level, const std::string& message) {
    std::time_t t = std::time(nullptr);
    std::tm tmval{};
    localtime_r(&t, &tmval);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmval);

    std::lock_guard<std::mutex> lock(writeMutex());
    std::cerr << "[" << ts << "] [" << levelName(level) << "] " << message << "\n";
}

} // namespace codegym
