#include "diff/summary_builder.hpp"

namespace sysdelta {

DiffSummary buildSummary(const DiffResult &result,
                         const std::string &baselineFile,
                         const std::string &currentFile)
{
    DiffSummary summary;
    summary.baselineFile = baselineFile;
    summary.currentFile = currentFile;
    if (result.error.has_value()) {
        return summary;
    }
    summary.totalAdded = result.added.size();
    summary.totalRemoved = result.removed.size();
    summary.totalChanged = result.changed.size();
    return summary;
}

void attachSummary(DiffResult &result,
                   const std::string &baselineFile,
                   const std::string &currentFile)
{
    result.summary = buildSummary(result, baselineFile, currentFile);
}

} // namespace sysdelta
