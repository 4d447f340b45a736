#pragma once

#include <string>

#include "common/models.hpp"

namespace sysdelta {

/**
 * Load two snapshot files and diff them, baseline as the older side.
 *
 * The format of each file comes from its extension (.json or .csv). Both
 * files are read completely before the diff starts.
 *
 * Never throws. When either file cannot be used the result keeps its usual
 * shape, but added, removed and changed each hold a single "error" entry
 * with the reason, error is set and the summary counts are zero.
 */
DiffResult compareSnapshotFiles(const std::string &baselinePath,
                                const std::string &currentPath,
                                DiffStrategy strategy = DiffStrategy::Nested);

// Same as above for snapshots already in memory, e.g. a live collection.
DiffResult compareSnapshots(const Snapshot &baseline, const Snapshot &current,
                            const std::string &baselineId,
                            const std::string &currentId,
                            DiffStrategy strategy = DiffStrategy::Nested);

DiffResult makeErrorResult(const std::string &message,
                           const std::string &baselineId,
                           const std::string &currentId);

} // namespace sysdelta
