#include "codemap/common/Logger.h"
#include "codemap/backends/SpdlogBackend.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <string_view>

namespace codemap {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

std::mutex& backendMutex() {
    static std::mutex mutex;
    return mutex;
}

// Lines kept in memory while capture is on; the oldest are dropped first.
constexpr size_t kCaptureLimit = 20000;

struct CaptureBuffer {
    std::mutex mutex;
    bool enabled = false;
    std::deque<std::string> lines;
};

CaptureBuffer& captureBuffer() {
    static CaptureBuffer buffer;
    return buffer;
}

}  // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: break;
    }
    return "off";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    for (char& c : lower) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    if (lower == "warning") return LogLevel::Warn;
    if (lower == "err") return LogLevel::Error;
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        const auto level = static_cast<LogLevel>(i);
        if (lower == logLevelName(level)) return level;
    }
    return std::nullopt;
}

std::unique_ptr<ILoggerBackend> Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard lock(backendMutex());
    std::swap(backend_, backend);
    return backend;
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard lock(backendMutex());
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    std::lock_guard lock(backendMutex());
    backend_->setLevel(level);
}

void Logger::flush() {
    ensureBackend();
    std::lock_guard lock(backendMutex());
    backend_->flush();
}

void Logger::ensureBackend() {
    initialize();
}

void Logger::log(LogLevel level, const std::string& message, const std::source_location& loc) {
    std::string line = extractFunctionName(loc);
    line += "() - ";
    line += message;

    ensureBackend();
    {
        std::lock_guard lock(backendMutex());
        backend_->log(level, line, loc);
    }
    captureLog(level, line);
}

void Logger::enableCapture(bool enable) {
    auto& buffer = captureBuffer();
    std::lock_guard lock(buffer.mutex);
    buffer.enabled = enable;
}

bool Logger::isCaptureEnabled() {
    auto& buffer = captureBuffer();
    std::lock_guard lock(buffer.mutex);
    return buffer.enabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    auto& buffer = captureBuffer();
    std::lock_guard lock(buffer.mutex);

    std::vector<std::string> matches;
    for (const auto& line : buffer.lines) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            matches.push_back(line);
        }
    }

    if (maxLines > 0 && matches.size() > maxLines) {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return matches;
}

void Logger::clearCapturedLogs() {
    auto& buffer = captureBuffer();
    std::lock_guard lock(buffer.mutex);
    buffer.lines.clear();
}

void Logger::captureLog(LogLevel level, const std::string& line) {
    auto& buffer = captureBuffer();
    std::lock_guard lock(buffer.mutex);
    if (!buffer.enabled) {
        return;
    }
    if (buffer.lines.size() == kCaptureLimit) {
        buffer.lines.pop_front();
    }
    buffer.lines.push_back(std::string("[") + logLevelName(level) + "] " + line);
}

// "void codemap::Foo::bar<int>(const X&)" -> "codemap::Foo::bar"
std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string_view signature = loc.function_name();
    const size_t paren = signature.find('(');
    if (paren == std::string_view::npos) {
        return "Unknown";
    }
    signature = signature.substr(0, paren);

    std::string name;
    int depth = 0;
    for (char c : signature) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0) {
            // A space at template depth 0 separates the return type
            if (c == ' ') {
                name.clear();
            } else {
                name += c;
            }
        }
    }

    while (!name.empty() && (name.front() == '*' || name.front() == '&')) {
        name.erase(name.begin());
    }
    return name.empty() ? "Unknown" : name;
}

}  // namespace codemap
