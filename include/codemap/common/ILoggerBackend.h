#pragma once

#include <source_location>
#include <string>

namespace codemap {

/// Severity of a log line, lowest first
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Sink for codemap's log lines.
///
/// SpdlogBackend is installed on first use. A host that renders layouts
/// (viewer, language server, CI job) can route ingest warnings and layout
/// summaries into its own log instead:
/// @code
/// struct ViewerConsole : codemap::ILoggerBackend {
///     void log(codemap::LogLevel level, const std::string& line,
///              const std::source_location&) override { panel.append(level, line); }
///     void setLevel(codemap::LogLevel level) override { panel.setThreshold(level); }
///     void flush() override {}
/// };
/// codemap::Logger::setBackend(std::make_unique<ViewerConsole>());
/// @endcode
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param line Already formatted, prefixed with the calling function
    /// @param loc  Call site of the LOG_* macro
    virtual void log(LogLevel level, const std::string& line,
                     const std::source_location& loc) = 0;

    /// Lines below @p level are discarded by the backend
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace codemap
