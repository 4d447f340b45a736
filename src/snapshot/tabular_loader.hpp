#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "snapshot/csv_codec.hpp"

namespace sysdelta {

/**
 * Structured tier: the header names a Component column, a property column
 * (Property, or the producer variants Metric / Sensor) and a Value column.
 * Rows are grouped into {component: {property: value}} with every value kept
 * as a string. Extra columns such as Unit are ignored.
 *
 * Returns std::nullopt when the header does not have that shape.
 * Throws MalformedInputError when a data row lacks its component or property.
 */
std::optional<Snapshot> tryStructuredLoad(const std::vector<CsvRow> &rows);

/**
 * Path tier for the Key,Value table written by the flat export: each row
 * becomes a top-level entry {key: value}, so flattening the result gives the
 * original paths back. Applies when the header has Key and Value columns and
 * no Component column.
 *
 * Returns std::nullopt for any other header. Never throws.
 */
std::optional<Snapshot> tryKeyValueLoad(const std::vector<CsvRow> &rows);

/**
 * Fallback tier for any other table. Each data row is filed under its
 * Component cell when the table has one, otherwise under "row_<i>", and maps
 * every remaining header column to its cell text. Never throws.
 */
Snapshot fallbackFlattenLoad(const std::vector<CsvRow> &rows);

// Parse CSV text and try the structured tier, the path tier, then the fallback tier.
Snapshot loadTabularSnapshot(const std::string &content);
Snapshot loadTabularFile(const std::string &path);

} // namespace sysdelta
