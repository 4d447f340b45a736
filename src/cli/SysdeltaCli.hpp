#pragma once

#include <QStringList>

#include "common/app_config.hpp"

namespace sysdelta {

class SysdeltaCli
{
public:
    explicit SysdeltaCli(AppConfig config = loadAppConfig());

    // CLI dispatcher for live specs, comparisons and flattening.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runSpecs(const QStringList &args);
    int runCompare(const QStringList &args);
    int runFlatten(const QStringList &args);

    AppConfig m_config;
};

} // namespace sysdelta
