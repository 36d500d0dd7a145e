#include "codemap/backends/SpdlogBackend.h"
#include "codemap/common/Logger.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace codemap {

namespace {

constexpr const char* kLoggerName = "codemap";
constexpr const char* kLogFileName = "codemap.log";
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

// LOG_LEVEL wins over SPDLOG_LEVEL; unrecognised names leave the default.
std::optional<LogLevel> levelFromEnvironment() {
    for (const char* var : {"LOG_LEVEL", "SPDLOG_LEVEL"}) {
        const char* value = std::getenv(var);
        if (value != nullptr && *value != '\0') {
            return parseLogLevel(value);
        }
    }
    return std::nullopt;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    spdlog::drop(kLoggerName);

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    std::vector<spdlog::sink_ptr> sinks{console};

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / kLogFileName).string(), true);
        file->set_pattern(kFilePattern);
        sinks.push_back(std::move(file));
    }

    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger_->set_level(convertLevel(levelFromEnvironment().value_or(LogLevel::Info)));
    spdlog::register_logger(logger_);
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace codemap
