#include "snapshot/snapshot_collector.hpp"

#include <map>
#include <optional>
#include <string>

#include <QFile>
#include <QStorageInfo>
#include <QSysInfo>
#include <QThread>

#include "common/logging.hpp"

namespace sysdelta {

namespace {

constexpr qint64 kBytesPerMb = 1024 * 1024;

// Reads "key : value" lines such as /proc/cpuinfo and /proc/meminfo.
// The first occurrence of a key wins.
bool readProcKeyValues(const QString &path, std::map<std::string, std::string> &out)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return false;
    }

    while (!file.atEnd()) {
        const QString line = QString::fromUtf8(file.readLine());
        const int colon = line.indexOf(QChar(':'));
        if (colon <= 0) {
            continue;
        }
        const std::string key = line.left(colon).trimmed().toStdString();
        const std::string value = line.mid(colon + 1).trimmed().toStdString();
        out.emplace(key, value);
    }
    return true;
}

Snapshot errorComponent(const std::string &message)
{
    return Snapshot{{"error", message}};
}

Snapshot collectOs()
{
    return Snapshot{
        {"system", QSysInfo::kernelType().toStdString()},
        {"release", QSysInfo::kernelVersion().toStdString()},
        {"platform", QSysInfo::prettyProductName().toStdString()},
        {"architecture", QSysInfo::currentCpuArchitecture().toStdString()},
        {"hostname", QSysInfo::machineHostName().toStdString()}
    };
}

Snapshot collectCpu()
{
    Snapshot cpu = Snapshot::object();
    std::map<std::string, std::string> info;
    if (readProcKeyValues(QStringLiteral("/proc/cpuinfo"), info)) {
        const auto model = info.find("model name");
        if (model != info.end()) {
            cpu["model"] = model->second;
        }
    }
    cpu["cores"] = QThread::idealThreadCount();
    cpu["architecture"] = QSysInfo::currentCpuArchitecture().toStdString();
    return cpu;
}

// /proc/meminfo reports kB.
std::optional<qint64> meminfoMb(const std::map<std::string, std::string> &info,
                                const std::string &key)
{
    const auto found = info.find(key);
    if (found == info.end()) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 kb = QString::fromStdString(found->second)
                          .section(QChar(' '), 0, 0, QString::SectionSkipEmpty)
                          .toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return kb / 1024;
}

Snapshot collectRam()
{
    std::map<std::string, std::string> info;
    if (!readProcKeyValues(QStringLiteral("/proc/meminfo"), info)) {
        return errorComponent("Memory information not available on this system");
    }

    Snapshot ram = Snapshot::object();
    if (const auto total = meminfoMb(info, "MemTotal")) {
        ram["total"] = *total;
    }
    if (const auto available = meminfoMb(info, "MemAvailable")) {
        ram["available"] = *available;
    }
    if (const auto swap = meminfoMb(info, "SwapTotal")) {
        ram["swapTotal"] = *swap;
    }
    return ram;
}

Snapshot collectDisks()
{
    Snapshot disks = Snapshot::array();
    for (const QStorageInfo &volume : QStorageInfo::mountedVolumes()) {
        if (!volume.isValid() || !volume.isReady() || volume.bytesTotal() <= 0) {
            continue;
        }
        disks.push_back(Snapshot{
            {"device", QString::fromUtf8(volume.device()).toStdString()},
            {"mountpoint", volume.rootPath().toStdString()},
            {"fstype", QString::fromUtf8(volume.fileSystemType()).toStdString()},
            {"totalMB", volume.bytesTotal() / kBytesPerMb},
            {"freeMB", volume.bytesAvailable() / kBytesPerMb}
        });
    }
    return disks;
}

} // namespace

Snapshot collectSystemSpecs(const CollectOptions &options)
{
    Snapshot snapshot = Snapshot::object();
    if (options.os) {
        snapshot["os"] = collectOs();
    }
    if (options.cpu) {
        snapshot["cpu"] = collectCpu();
    }
    if (options.ram) {
        snapshot["ram"] = collectRam();
    }
    if (options.disk) {
        snapshot["disk"] = collectDisks();
    }

    SDLOG_DEBUG(QStringLiteral("SnapshotCollector"),
                QStringLiteral("collectSystemSpecs"),
                QStringLiteral("snapshot_collected"),
                QStringLiteral("user_invocation"),
                QStringLiteral("host_query"),
                (nlohmann::json{{"components", snapshot.size()}}));
    return snapshot;
}

} // namespace sysdelta
