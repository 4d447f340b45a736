#pragma once

#include <string>

#include "common/models.hpp"

namespace sysdelta {

// .json selects the tree loader, .csv the tabular loader (case-insensitive).
// Throws UnsupportedFormatError naming the extension otherwise.
SnapshotFormat detectFormat(const std::string &path);

// Reads the whole file and releases it before returning.
// Throws FileAccessError for a missing or unreadable file.
std::string readSnapshotFile(const std::string &path);

Snapshot loadSnapshotFile(const std::string &path);
Snapshot loadSnapshotFile(const std::string &path, SnapshotFormat format);

} // namespace sysdelta
