#pragma once

#include <string>

#include <QDateTime>

#include "common/models.hpp"

namespace sysdelta {

/**
 * Pick the CSV layout for a snapshot from its shape:
 * - Records: non-empty array of objects (process lists), one row per record
 * - Sensors: non-empty object of scalars, Component,Sensor,Value,Unit
 * - Components: object whose values are all objects or arrays of objects
 *   (or empty), Component,Property,Value
 * - Flat: everything else, Key,Value over the flattened paths
 *
 * Components and Flat exports load back to the same flattened paths.
 * Records rows reload as row_<i> and Sensors rows under "Sensor".
 */
ExportLayout chooseCsvLayout(const Snapshot &snapshot);

std::string exportJson(const Snapshot &snapshot);
std::string exportCsv(const Snapshot &snapshot);
std::string exportCsv(const Snapshot &snapshot, ExportLayout layout);

// sysdelta_export_YYYY-MM-DD_HH-mm-ss.<ext>, inside directory when it is not empty.
std::string defaultExportPath(ExportFormat format, const QDateTime &when,
                              const std::string &directory);

/**
 * Write the snapshot to path in the requested format and return the path
 * actually written. The format's extension is appended when path lacks it.
 * Throws FileAccessError when the file cannot be written.
 */
std::string exportSnapshotToFile(const Snapshot &snapshot, ExportFormat format,
                                 const std::string &path);

} // namespace sysdelta
