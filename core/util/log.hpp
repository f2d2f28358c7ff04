#pragma once

#include <sstream>
#include <string>

namespace codegym {

// ─── Logging ───────────────────────────────────────────────────
// Leveled stderr logging. One line per record:
//   [2026-01-01 12:00:00] [INFO] message
// The minimum level is process-wide. It starts at INFO, or at the
// value of CODEGYM_LOG_LEVEL (debug|info|warn|error|off) if set.

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void setLogLevel(LogLevel level);
LogLevel logLevel();

/// Parse "debug", "info", "warn", "error" or "off". Unknown → Info.
LogLevel parseLogLevel(const std::string& name);

bool logEnabled(LogLevel level);
void logWrite(LogLevel level, const std::string& message);

} // namespace codegym

#define CODEGYM_LOG_AT(level, expr)                                   \
    do {                                                              \
        if (::codegym::logEnabled(level)) {                           \
            std::ostringstream codegym_log_os_;                       \
            codegym_log_os_ << expr;                                  \
            ::codegym::logWrite(level, codegym_log_os_.str());        \
        }                                                             \
    } while (0)

#define CODEGYM_LOG_DEBUG(expr) CODEGYM_LOG_AT(::codegym::LogLevel::Debug, expr)
#define CODEGYM_LOG_INFO(expr)  CODEGYM_LOG_AT(::codegym::LogLevel::Info, expr)
#define CODEGYM_LOG_WARN(expr)  CODEGYM_LOG_AT(::codegym::LogLevel::Warn, expr)
#define CODEGYM_LOG_ERROR(expr) CODEGYM_LOG_AT(::codegym::LogLevel::Error, expr)
