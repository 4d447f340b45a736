#include "snapshot/snapshot_reader.hpp"

#include <QFile>
#include <QFileInfo>

#include "common/errors.hpp"
#include "snapshot/tabular_loader.hpp"
#include "snapshot/tree_loader.hpp"

namespace sysdelta {

SnapshotFormat detectFormat(const std::string &path)
{
    const QString suffix = QFileInfo(QString::fromStdString(path)).suffix().toLower();
    if (suffix == QStringLiteral("json")) {
        return SnapshotFormat::Tree;
    }
    if (suffix == QStringLiteral("csv")) {
        return SnapshotFormat::Tabular;
    }
    throw UnsupportedFormatError(suffix.isEmpty() ? std::string()
                                                  : "." + suffix.toStdString());
}

std::string readSnapshotFile(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.exists()) {
        throw FileAccessError(path, "no such file", true);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw FileAccessError(path, file.errorString().toStdString(), false);
    }

    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw FileAccessError(path, file.errorString().toStdString(), false);
    }
    return data.toStdString();
}

Snapshot loadSnapshotFile(const std::string &path)
{
    return loadSnapshotFile(path, detectFormat(path));
}

Snapshot loadSnapshotFile(const std::string &path, SnapshotFormat format)
{
    switch (format) {
    case SnapshotFormat::Tree:
        return loadTreeFile(path);
    case SnapshotFormat::Tabular:
        return loadTabularFile(path);
    }
    return loadTreeFile(path);
}

} // namespace sysdelta
