#include "common/app_config.hpp"

namespace sysdelta {

AppConfig loadAppConfig()
{
    AppConfig config;
    config.traceEnabled = qEnvironmentVariableIntValue("SYSDELTA_TRACE") == 1;
    config.logDirectory = qEnvironmentVariable("SYSDELTA_LOG_DIR");
    config.exportDirectory = qEnvironmentVariable("SYSDELTA_EXPORT_DIR");

    const QString level = qEnvironmentVariable("SYSDELTA_LOG_LEVEL");
    if (!level.isEmpty()) {
        // Unknown values keep the default rather than silencing logs.
        if (const auto parsed = logging::parseLogLevel(level)) {
            config.logLevel = *parsed;
        }
    }
    return config;
}

logging::LogSettings toLogSettings(const AppConfig &config, const QString &processName)
{
    logging::LogSettings settings;
    settings.processName = processName;
    settings.traceEnabled = config.traceEnabled;
    settings.logDirectory = config.logDirectory;
    settings.minimumLevel = config.logLevel;
    return settings;
}

} // namespace sysdelta
