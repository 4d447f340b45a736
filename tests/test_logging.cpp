#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/app_config.hpp"
#include "common/logging.hpp"

namespace {

QByteArray lastLine(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    QByteArray line;
    while (!file.atEnd()) {
        const QByteArray next = file.readLine().trimmed();
        if (!next.isEmpty()) {
            line = next;
        }
    }
    return line;
}

} // namespace

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testTraceWrites();
    void testMinimumLevelDrops();
    void testLogDirectoryOverride();
    void testCorrelationScope();
    void testParseLogLevel();
    void testAppConfigFromEnvironment();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logsDir() const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logsDir() const
{
    return m_tempDir.path() + "/.local/share/sysdelta/logs";
}

void LoggingTests::testLogEventWrites()
{
    sysdelta::logging::LogSettings settings;
    settings.processName = QStringLiteral("sysdelta-test");
    sysdelta::logging::initLogging(settings);
    const QString logPath = logsDir() + "/sysdelta-test.log";

    sysdelta::logging::logEvent(sysdelta::logging::LogLevel::Info,
                                QStringLiteral("sysdelta-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                sysdelta::logging::defaultWho(),
                                QStringLiteral("corr-1"),
                                nlohmann::json{{"key", "value"}});

    QVERIFY(QFile::exists(logPath));
    const QByteArray line = lastLine(logPath);
    QVERIFY(!line.isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testTraceWrites()
{
    sysdelta::logging::LogSettings settings;
    settings.processName = QStringLiteral("sysdelta-test");
    settings.traceEnabled = true;
    sysdelta::logging::initLogging(settings);
    QVERIFY(sysdelta::logging::isTraceEnabled());
    const QString tracePath = logsDir() + "/sysdelta-test-trace.log";

    SDLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testTraceWrites"),
                QStringLiteral("test_trace"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                nlohmann::json::object());

    QVERIFY(QFile::exists(tracePath));
    const auto parsed = nlohmann::json::parse(lastLine(tracePath).toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_trace"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("DEBUG"));
}

void LoggingTests::testMinimumLevelDrops()
{
    sysdelta::logging::LogSettings settings;
    settings.processName = QStringLiteral("sysdelta-levels");
    settings.minimumLevel = sysdelta::logging::LogLevel::Warn;
    sysdelta::logging::initLogging(settings);
    const QString logPath = logsDir() + "/sysdelta-levels.log";

    SDLOG_INFO(QStringLiteral("Test"), QStringLiteral("testMinimumLevelDrops"),
               QStringLiteral("dropped_info"), QStringLiteral("unit_test"),
               QStringLiteral("macro"), nlohmann::json::object());
    SDLOG_WARN(QStringLiteral("Test"), QStringLiteral("testMinimumLevelDrops"),
               QStringLiteral("kept_warn"), QStringLiteral("unit_test"),
               QStringLiteral("macro"), nlohmann::json::object());

    QFile file(logPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray content = file.readAll();
    QVERIFY(!content.contains("dropped_info"));
    QVERIFY(content.contains("kept_warn"));
}

void LoggingTests::testLogDirectoryOverride()
{
    QTemporaryDir overrideDir;
    QVERIFY(overrideDir.isValid());

    sysdelta::logging::LogSettings settings;
    settings.processName = QStringLiteral("sysdelta-override");
    settings.logDirectory = overrideDir.path();
    sysdelta::logging::initLogging(settings);
    QCOMPARE(sysdelta::logging::logDirectory(), overrideDir.path());

    SDLOG_ERROR(QStringLiteral("Test"), QStringLiteral("testLogDirectoryOverride"),
                QStringLiteral("override_error"), QStringLiteral("unit_test"),
                QStringLiteral("macro"), (nlohmann::json{{"a", 1}, {"b", 2}}));

    QVERIFY(QFile::exists(overrideDir.path() + "/sysdelta-override.log"));
    QVERIFY(!QFile::exists(logsDir() + "/sysdelta-override.log"));
}

void LoggingTests::testCorrelationScope()
{
    sysdelta::logging::setCorrelationId(QStringLiteral("outer"));
    {
        sysdelta::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(sysdelta::logging::currentCorrelationId(), QStringLiteral("inner"));
    }
    QCOMPARE(sysdelta::logging::currentCorrelationId(), QStringLiteral("outer"));
    sysdelta::logging::setCorrelationId(QString());
}

void LoggingTests::testParseLogLevel()
{
    using sysdelta::logging::LogLevel;
    QVERIFY(sysdelta::logging::parseLogLevel(QStringLiteral("debug")) == LogLevel::Debug);
    QVERIFY(sysdelta::logging::parseLogLevel(QStringLiteral(" WARNING ")) == LogLevel::Warn);
    QVERIFY(sysdelta::logging::parseLogLevel(QStringLiteral("Error")) == LogLevel::Error);
    QVERIFY(!sysdelta::logging::parseLogLevel(QStringLiteral("loud")).has_value());
    QCOMPARE(sysdelta::logging::levelToString(LogLevel::Warn), QStringLiteral("WARN"));
}

void LoggingTests::testAppConfigFromEnvironment()
{
    qputenv("SYSDELTA_TRACE", "1");
    qputenv("SYSDELTA_LOG_LEVEL", "error");
    qputenv("SYSDELTA_LOG_DIR", "/tmp/sysdelta-logs");
    qputenv("SYSDELTA_EXPORT_DIR", "/tmp/sysdelta-exports");

    const sysdelta::AppConfig config = sysdelta::loadAppConfig();
    QVERIFY(config.traceEnabled);
    QVERIFY(config.logLevel == sysdelta::logging::LogLevel::Error);
    QCOMPARE(config.logDirectory, QStringLiteral("/tmp/sysdelta-logs"));
    QCOMPARE(config.exportDirectory, QStringLiteral("/tmp/sysdelta-exports"));

    const auto settings = sysdelta::toLogSettings(config, QStringLiteral("sysdelta"));
    QCOMPARE(settings.processName, QStringLiteral("sysdelta"));
    QVERIFY(settings.traceEnabled);

    qputenv("SYSDELTA_LOG_LEVEL", "verbose");
    QVERIFY(sysdelta::loadAppConfig().logLevel == sysdelta::logging::LogLevel::Info);

    qunsetenv("SYSDELTA_TRACE");
    qunsetenv("SYSDELTA_LOG_LEVEL");
    qunsetenv("SYSDELTA_LOG_DIR");
    qunsetenv("SYSDELTA_EXPORT_DIR");
    QVERIFY(!sysdelta::loadAppConfig().traceEnabled);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
