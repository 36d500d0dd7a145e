#pragma once

#include "codemap/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace codemap {

/// "trace" .. "critical", "off"
const char* logLevelName(LogLevel level);

/// Case-insensitive inverse of logLevelName; also accepts "warning" and "err".
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Process-wide log facade behind the LOG_* macros.
///
/// Every line goes to the installed ILoggerBackend (SpdlogBackend unless a
/// host injected another one) prefixed with the calling function, e.g.
/// "codemap::GraphIngest::normalize() - Dangling edge #3 ...".
///
/// While capture is enabled each line is also kept in memory as
/// "[<level>] <line>", regardless of the backend's level. Tests use this to
/// assert on ingest diagnostics:
/// @code
/// codemap::Logger::enableCapture(true);
/// engine.layout(graph);
/// EXPECT_FALSE(codemap::Logger::getCapturedLogs("Dangling").empty());
/// @endcode
class Logger {
public:
    /// Installs @p backend and returns the one it replaces (may be null).
    static std::unique_ptr<ILoggerBackend> setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Installs SpdlogBackend if no backend is set yet. With @p logDir and
    /// @p logToFile, lines are also appended to <logDir>/codemap.log.
    static void initialize();
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);
    static void flush();

    static void log(LogLevel level, const std::string& message,
                    const std::source_location& loc = std::source_location::current());

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /// Captured lines containing @p pattern (all if empty), oldest first.
    /// With @p maxLines > 0 only the newest maxLines matches are returned.
    static std::vector<std::string> getCapturedLogs(const std::string& pattern = "",
                                                    size_t maxLines = 0);
    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(LogLevel level, const std::string& line);
};

}  // namespace codemap

#define CODEMAP_LOG_AT(level, ...) \
    codemap::Logger::log(level, std::format(__VA_ARGS__), std::source_location::current())

#define LOG_TRACE(...) CODEMAP_LOG_AT(codemap::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) CODEMAP_LOG_AT(codemap::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  CODEMAP_LOG_AT(codemap::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  CODEMAP_LOG_AT(codemap::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) CODEMAP_LOG_AT(codemap::LogLevel::Error, __VA_ARGS__)
