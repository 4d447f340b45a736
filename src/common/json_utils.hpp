#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sysdelta {

inline NodeKind kindOf(const Snapshot &value)
{
    switch (value.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        return NodeKind::Null;
    case nlohmann::json::value_t::boolean:
        return NodeKind::Boolean;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
        return NodeKind::Number;
    // Binary values never come out of the loaders; treat them as opaque scalars.
    case nlohmann::json::value_t::string:
    case nlohmann::json::value_t::binary:
        return NodeKind::String;
    case nlohmann::json::value_t::object:
        return NodeKind::Map;
    case nlohmann::json::value_t::array:
        return NodeKind::Sequence;
    }
    return NodeKind::Null;
}

inline bool isScalarKind(NodeKind kind)
{
    switch (kind) {
    case NodeKind::Null:
    case NodeKind::Boolean:
    case NodeKind::Number:
    case NodeKind::String:
        return true;
    case NodeKind::Map:
    case NodeKind::Sequence:
        return false;
    }
    return true;
}

inline std::string toKindString(NodeKind kind)
{
    switch (kind) {
    case NodeKind::Null:
        return "null";
    case NodeKind::Boolean:
        return "boolean";
    case NodeKind::Number:
        return "number";
    case NodeKind::String:
        return "string";
    case NodeKind::Map:
        return "map";
    case NodeKind::Sequence:
        return "sequence";
    }
    return "null";
}

inline std::string toFormatString(SnapshotFormat format)
{
    switch (format) {
    case SnapshotFormat::Tree:
        return "json";
    case SnapshotFormat::Tabular:
        return "csv";
    }
    return "json";
}

inline std::string toStrategyString(DiffStrategy strategy)
{
    switch (strategy) {
    case DiffStrategy::Nested:
        return "nested";
    case DiffStrategy::Flat:
        return "flat";
    }
    return "nested";
}

inline std::string toLayoutString(ExportLayout layout)
{
    switch (layout) {
    case ExportLayout::Records:
        return "records";
    case ExportLayout::Components:
        return "components";
    case ExportLayout::Sensors:
        return "sensors";
    case ExportLayout::Flat:
        return "flat";
    }
    return "flat";
}

inline std::optional<ExportFormat> parseExportFormat(const std::string &value)
{
    if (value == "json") {
        return ExportFormat::Json;
    }
    if (value == "csv") {
        return ExportFormat::Csv;
    }
    return std::nullopt;
}

inline void to_json(Snapshot &j, const DiffSummary &summary)
{
    j = Snapshot{
        {"total_added", summary.totalAdded},
        {"total_removed", summary.totalRemoved},
        {"total_changed", summary.totalChanged},
        {"baseline_file", summary.baselineFile},
        {"current_file", summary.currentFile}
    };
}

inline void from_json(const Snapshot &j, DiffSummary &summary)
{
    summary.totalAdded = j.value("total_added", static_cast<std::size_t>(0));
    summary.totalRemoved = j.value("total_removed", static_cast<std::size_t>(0));
    summary.totalChanged = j.value("total_changed", static_cast<std::size_t>(0));
    summary.baselineFile = j.value("baseline_file", "");
    summary.currentFile = j.value("current_file", "");
}

inline void to_json(Snapshot &j, const DiffResult &result)
{
    Snapshot summary = result.summary;
    if (result.error.has_value()) {
        summary["error"] = *result.error;
    }
    j = Snapshot{
        {"added", result.added},
        {"removed", result.removed},
        {"changed", result.changed},
        {"summary", summary}
    };
}

inline void from_json(const Snapshot &j, DiffResult &result)
{
    const auto category = [&j](const char *key) {
        if (j.contains(key) && j.at(key).is_object()) {
            return j.at(key);
        }
        return Snapshot(Snapshot::object());
    };
    result.added = category("added");
    result.removed = category("removed");
    result.changed = category("changed");

    if (j.contains("summary") && j.at("summary").is_object()) {
        const auto &summary = j.at("summary");
        result.summary = summary.get<DiffSummary>();
        if (summary.contains("error") && summary.at("error").is_string()) {
            result.error = summary.at("error").get<std::string>();
        } else {
            result.error.reset();
        }
    } else {
        result.summary = DiffSummary{};
        result.error.reset();
    }
}

} // namespace sysdelta
