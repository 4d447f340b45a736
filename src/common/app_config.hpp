#pragma once

#include <QString>

#include "common/logging.hpp"

namespace sysdelta {

// Process-wide settings read once at start-up from the environment:
//   SYSDELTA_TRACE=1        debug events plus <process>-trace.log
//   SYSDELTA_LOG_DIR        log directory override
//   SYSDELTA_LOG_LEVEL      debug|info|warn|error
//   SYSDELTA_EXPORT_DIR     directory for generated export file names
struct AppConfig {
    bool traceEnabled = false;
    QString logDirectory;
    logging::LogLevel logLevel = logging::LogLevel::Info;
    QString exportDirectory;
};

AppConfig loadAppConfig();

logging::LogSettings toLogSettings(const AppConfig &config, const QString &processName);

} // namespace sysdelta
