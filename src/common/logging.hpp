#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace sysdelta::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogSettings {
    QString processName;
    // Writes debug events and mirrors every event into <process>-trace.log.
    bool traceEnabled = false;
    // Empty means $HOME/.local/share/sysdelta/logs.
    QString logDirectory;
    LogLevel minimumLevel = LogLevel::Info;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const LogSettings &settings);

bool isTraceEnabled();
QString logDirectory();

QString levelToString(LogLevel level);
std::optional<LogLevel> parseLogLevel(const QString &value);

// Thread-local correlation support for linking the events of one comparison.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. Use empty strings where a field is unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace sysdelta::logging

#define SDLOG_EVENT_(level, component, where, what, why, how, ctxJson) \
    ::sysdelta::logging::logEvent((level), \
                                  ::sysdelta::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), \
                                  ::sysdelta::logging::defaultWho(), \
                                  QString(), (ctxJson))

#define SDLOG_DEBUG(component, where, what, why, how, ctxJson) \
    SDLOG_EVENT_(::sysdelta::logging::LogLevel::Debug, component, where, what, why, how, ctxJson)

#define SDLOG_INFO(component, where, what, why, how, ctxJson) \
    SDLOG_EVENT_(::sysdelta::logging::LogLevel::Info, component, where, what, why, how, ctxJson)

#define SDLOG_WARN(component, where, what, why, how, ctxJson) \
    SDLOG_EVENT_(::sysdelta::logging::LogLevel::Warn, component, where, what, why, how, ctxJson)

#define SDLOG_ERROR(component, where, what, why, how, ctxJson) \
    SDLOG_EVENT_(::sysdelta::logging::LogLevel::Error, component, where, what, why, how, ctxJson)
