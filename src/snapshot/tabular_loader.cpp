#include "snapshot/tabular_loader.hpp"

#include <algorithm>
#include <cctype>

#include "common/errors.hpp"
#include "snapshot/snapshot_reader.hpp"

namespace sysdelta {

namespace {

constexpr char kComponentColumn[] = "component";
constexpr char kValueColumn[] = "value";
constexpr char kKeyColumn[] = "key";
const std::vector<std::string> kPropertyColumns = {"property", "metric", "sensor"};

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::optional<size_t> findColumn(const CsvRow &header, const std::string &name)
{
    for (size_t i = 0; i < header.size(); ++i) {
        if (toLower(trim(header[i])) == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::string cellAt(const CsvRow &row, size_t index)
{
    return index < row.size() ? row[index] : std::string();
}

} // namespace

std::optional<Snapshot> tryStructuredLoad(const std::vector<CsvRow> &rows)
{
    if (rows.empty()) {
        return std::nullopt;
    }

    const CsvRow &header = rows.front();
    const auto componentColumn = findColumn(header, kComponentColumn);
    const auto valueColumn = findColumn(header, kValueColumn);
    std::optional<size_t> propertyColumn;
    for (const auto &name : kPropertyColumns) {
        propertyColumn = findColumn(header, name);
        if (propertyColumn) {
            break;
        }
    }
    if (!componentColumn || !propertyColumn || !valueColumn) {
        return std::nullopt;
    }

    Snapshot snapshot = Snapshot::object();
    for (size_t i = 1; i < rows.size(); ++i) {
        const CsvRow &row = rows[i];
        const std::string component = trim(cellAt(row, *componentColumn));
        const std::string property = trim(cellAt(row, *propertyColumn));
        if (component.empty()) {
            throw MalformedInputError("row " + std::to_string(i)
                                      + " is missing the component field");
        }
        if (property.empty()) {
            throw MalformedInputError("row " + std::to_string(i)
                                      + " is missing the property field");
        }
        if (!snapshot.contains(component)) {
            snapshot[component] = Snapshot::object();
        }
        snapshot[component][property] = cellAt(row, *valueColumn);
    }
    return snapshot;
}

std::optional<Snapshot> tryKeyValueLoad(const std::vector<CsvRow> &rows)
{
    if (rows.empty()) {
        return std::nullopt;
    }

    const CsvRow &header = rows.front();
    const auto keyColumn = findColumn(header, kKeyColumn);
    const auto valueColumn = findColumn(header, kValueColumn);
    if (!keyColumn || !valueColumn || findColumn(header, kComponentColumn)) {
        return std::nullopt;
    }

    Snapshot snapshot = Snapshot::object();
    for (size_t i = 1; i < rows.size(); ++i) {
        // Keys are paths and are kept verbatim; an empty one is the path of
        // an empty root key.
        snapshot[cellAt(rows[i], *keyColumn)] = cellAt(rows[i], *valueColumn);
    }
    return snapshot;
}

Snapshot fallbackFlattenLoad(const std::vector<CsvRow> &rows)
{
    Snapshot snapshot = Snapshot::object();
    if (rows.empty()) {
        return snapshot;
    }

    const CsvRow &header = rows.front();
    const auto componentColumn = findColumn(header, kComponentColumn);

    for (size_t i = 1; i < rows.size(); ++i) {
        const CsvRow &row = rows[i];
        std::string component;
        if (componentColumn) {
            component = trim(cellAt(row, *componentColumn));
        }
        if (component.empty()) {
            component = "row_" + std::to_string(i - 1);
        }
        if (!snapshot.contains(component)) {
            snapshot[component] = Snapshot::object();
        }

        Snapshot &properties = snapshot[component];
        for (size_t column = 0; column < header.size(); ++column) {
            if (componentColumn && column == *componentColumn) {
                continue;
            }
            properties[trim(header[column])] = cellAt(row, column);
        }
    }
    return snapshot;
}

Snapshot loadTabularSnapshot(const std::string &content)
{
    const std::vector<CsvRow> rows = parseCsv(content);
    if (auto structured = tryStructuredLoad(rows)) {
        return std::move(*structured);
    }
    if (auto paths = tryKeyValueLoad(rows)) {
        return std::move(*paths);
    }
    return fallbackFlattenLoad(rows);
}

Snapshot loadTabularFile(const std::string &path)
{
    return loadTabularSnapshot(readSnapshotFile(path));
}

} // namespace sysdelta
