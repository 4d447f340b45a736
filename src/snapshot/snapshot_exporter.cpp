#include "snapshot/snapshot_exporter.hpp"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "snapshot/csv_codec.hpp"
#include "snapshot/flattener.hpp"

namespace sysdelta {

namespace {

constexpr char kCelsius[] = "\xC2\xB0" "C";
constexpr char kScalarProperty[] = "value";

std::string extensionFor(ExportFormat format)
{
    switch (format) {
    case ExportFormat::Json:
        return "json";
    case ExportFormat::Csv:
        return "csv";
    }
    return "json";
}

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trimTrailingSpace(std::string value)
{
    while (!value.empty() && value.back() == ' ') {
        value.pop_back();
    }
    return value;
}

bool isComponentValue(const Snapshot &value)
{
    switch (kindOf(value)) {
    case NodeKind::Map:
        return true;
    case NodeKind::Sequence:
        return std::all_of(value.begin(), value.end(), [](const Snapshot &item) {
            return kindOf(item) == NodeKind::Map;
        });
    case NodeKind::Null:
    case NodeKind::Boolean:
    case NodeKind::Number:
    case NodeKind::String:
        return false;
    }
    return false;
}

void appendComponentRows(const std::string &component, const Snapshot &value,
                         std::string &out)
{
    switch (kindOf(value)) {
    case NodeKind::Map:
        for (const auto &entry : flatten(value)) {
            out += formatCsvRow({component, entry.path, entry.value});
        }
        return;
    case NodeKind::Sequence:
        // Each element becomes its own component so paths survive a reload.
        for (size_t i = 0; i < value.size(); ++i) {
            const std::string element = component + "[" + std::to_string(i) + "]";
            const Snapshot &item = value.at(i);
            if (kindOf(item) == NodeKind::Map) {
                appendComponentRows(element, item, out);
            } else {
                out += formatCsvRow({element, kScalarProperty, scalarToString(item)});
            }
        }
        return;
    case NodeKind::Null:
    case NodeKind::Boolean:
    case NodeKind::Number:
    case NodeKind::String:
        out += formatCsvRow({component, kScalarProperty, scalarToString(value)});
        return;
    }
}

std::string writeComponents(const Snapshot &snapshot)
{
    std::string out = formatCsvRow({"Component", "Property", "Value"});
    for (const auto &item : snapshot.items()) {
        appendComponentRows(item.key(), item.value(), out);
    }
    return out;
}

std::string writeRecords(const Snapshot &snapshot)
{
    CsvRow header;
    for (const auto &item : snapshot.at(0).items()) {
        header.push_back(item.key());
    }

    std::string out = formatCsvRow(header);
    for (const auto &record : snapshot) {
        CsvRow cells;
        cells.reserve(header.size());
        for (const auto &key : header) {
            const auto found = record.find(key);
            cells.push_back(found == record.end() ? std::string() : scalarToString(*found));
        }
        out += formatCsvRow(cells);
    }
    return out;
}

std::string writeSensors(const Snapshot &snapshot)
{
    std::string out = formatCsvRow({"Component", "Sensor", "Value", "Unit"});
    for (const auto &item : snapshot.items()) {
        std::string reading = scalarToString(item.value());
        std::string unit;
        if (kindOf(item.value()) == NodeKind::Number) {
            unit = kCelsius;
        } else if (endsWith(reading, kCelsius)) {
            reading = trimTrailingSpace(reading.substr(0, reading.size() - (sizeof(kCelsius) - 1)));
            unit = kCelsius;
        }
        out += formatCsvRow({"Sensor", item.key(), reading, unit});
    }
    return out;
}

std::string writeFlat(const Snapshot &snapshot)
{
    std::string out = formatCsvRow({"Key", "Value"});
    for (const auto &entry : flatten(snapshot)) {
        out += formatCsvRow({entry.path, entry.value});
    }
    return out;
}

} // namespace

ExportLayout chooseCsvLayout(const Snapshot &snapshot)
{
    switch (kindOf(snapshot)) {
    case NodeKind::Sequence: {
        if (snapshot.empty()) {
            return ExportLayout::Flat;
        }
        const bool allRecords = std::all_of(snapshot.begin(), snapshot.end(),
                                            [](const Snapshot &item) {
                                                return kindOf(item) == NodeKind::Map;
                                            });
        return allRecords ? ExportLayout::Records : ExportLayout::Flat;
    }
    case NodeKind::Map: {
        if (snapshot.empty()) {
            return ExportLayout::Components;
        }
        const bool allScalars = std::all_of(snapshot.begin(), snapshot.end(),
                                            [](const Snapshot &item) {
                                                return isScalarKind(kindOf(item));
                                            });
        if (allScalars) {
            return ExportLayout::Sensors;
        }
        // A scalar component, or a list element that is not a map, has no
        // Component,Property pair that reloads under its own path.
        const bool allComponents = std::all_of(snapshot.begin(), snapshot.end(),
                                               [](const Snapshot &item) {
                                                   return isComponentValue(item);
                                               });
        return allComponents ? ExportLayout::Components : ExportLayout::Flat;
    }
    case NodeKind::Null:
    case NodeKind::Boolean:
    case NodeKind::Number:
    case NodeKind::String:
        return ExportLayout::Flat;
    }
    return ExportLayout::Flat;
}

std::string exportJson(const Snapshot &snapshot)
{
    return snapshot.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string exportCsv(const Snapshot &snapshot)
{
    return exportCsv(snapshot, chooseCsvLayout(snapshot));
}

std::string exportCsv(const Snapshot &snapshot, ExportLayout layout)
{
    // Layouts that need a particular shape fall back to Flat when forced onto
    // data without it.
    const ExportLayout fitting = chooseCsvLayout(snapshot);
    switch (layout) {
    case ExportLayout::Records:
        return fitting == ExportLayout::Records ? writeRecords(snapshot) : writeFlat(snapshot);
    case ExportLayout::Components:
    case ExportLayout::Sensors:
        if (kindOf(snapshot) != NodeKind::Map) {
            return writeFlat(snapshot);
        }
        return layout == ExportLayout::Sensors && fitting == ExportLayout::Sensors
            ? writeSensors(snapshot)
            : writeComponents(snapshot);
    case ExportLayout::Flat:
        return writeFlat(snapshot);
    }
    return writeFlat(snapshot);
}

std::string defaultExportPath(ExportFormat format, const QDateTime &when,
                              const std::string &directory)
{
    const QString name = QStringLiteral("sysdelta_export_%1.%2")
        .arg(when.toString(QStringLiteral("yyyy-MM-dd_HH-mm-ss")),
             QString::fromStdString(extensionFor(format)));
    if (directory.empty()) {
        return name.toStdString();
    }
    return QDir(QString::fromStdString(directory)).filePath(name).toStdString();
}

std::string exportSnapshotToFile(const Snapshot &snapshot, ExportFormat format,
                                 const std::string &path)
{
    const std::string extension = extensionFor(format);
    std::string target = path;
    if (QFileInfo(QString::fromStdString(target)).suffix().toLower().toStdString() != extension) {
        target += "." + extension;
    }

    const std::string payload = format == ExportFormat::Json ? exportJson(snapshot)
                                                             : exportCsv(snapshot);

    QFile file(QString::fromStdString(target));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw FileAccessError(target, file.errorString().toStdString(), false);
    }
    const QByteArray data = QByteArray::fromStdString(payload);
    if (file.write(data) != data.size()) {
        throw FileAccessError(target, file.errorString().toStdString(), false);
    }

    SDLOG_INFO(QStringLiteral("SnapshotExporter"),
               QStringLiteral("exportSnapshotToFile"),
               QStringLiteral("snapshot_exported"),
               QStringLiteral("user_invocation"),
               QStringLiteral("file_write"),
               (nlohmann::json{{"path", target},
                               {"format", extension},
                               {"bytes", data.size()}}));
    return target;
}

} // namespace sysdelta
