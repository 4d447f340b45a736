#include <QCoreApplication>

#include "cli/SysdeltaCli.hpp"
#include "common/app_config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sysdelta"));

    sysdelta::AppConfig config = sysdelta::loadAppConfig();
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        }
    }
    sysdelta::logging::initLogging(
        sysdelta::toLogSettings(config, QStringLiteral("sysdelta")));
    SDLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               (nlohmann::json{{"args", argc - 1}}));

    // The dispatcher strips --trace itself.
    sysdelta::SysdeltaCli cli(config);
    return cli.run(argc, argv);
}
