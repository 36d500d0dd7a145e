#pragma once

#include "codemap/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace codemap {

/**
 * @brief spdlog-based logger backend (the default backend)
 *
 * Console sink always; a basic file sink under logDir when logToFile is set.
 * The initial level comes from LOG_LEVEL (or SPDLOG_LEVEL), info otherwise.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace codemap
