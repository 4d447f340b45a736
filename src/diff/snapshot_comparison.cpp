#include "diff/snapshot_comparison.hpp"

#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "diff/diff_engine.hpp"
#include "diff/summary_builder.hpp"
#include "snapshot/snapshot_reader.hpp"

namespace sysdelta {

namespace {

constexpr char kErrorKey[] = "error";

DiffResult failComparison(const std::string &message,
                          const std::string &baselinePath,
                          const std::string &currentPath)
{
    SDLOG_WARN(QStringLiteral("SnapshotComparison"),
               QStringLiteral("compareSnapshotFiles"),
               QStringLiteral("compare_failed"),
               QStringLiteral("load_error"),
               QStringLiteral("file_load"),
               (nlohmann::json{{"baseline", baselinePath},
                               {"current", currentPath},
                               {"error", message}}));
    return makeErrorResult(message, baselinePath, currentPath);
}

} // namespace

DiffResult makeErrorResult(const std::string &message,
                           const std::string &baselineId,
                           const std::string &currentId)
{
    DiffResult result;
    result.error = message;
    result.added[kErrorKey] = message;
    result.removed[kErrorKey] = message;
    result.changed[kErrorKey] = message;
    attachSummary(result, baselineId, currentId);
    return result;
}

DiffResult compareSnapshots(const Snapshot &baseline, const Snapshot &current,
                            const std::string &baselineId,
                            const std::string &currentId,
                            DiffStrategy strategy)
{
    DiffResult result = diffWithStrategy(strategy, baseline, current);
    attachSummary(result, baselineId, currentId);

    SDLOG_INFO(QStringLiteral("SnapshotComparison"),
               QStringLiteral("compareSnapshots"),
               QStringLiteral("compare_done"),
               QStringLiteral("user_invocation"),
               QString::fromStdString(toStrategyString(strategy)),
               (nlohmann::json{{"baseline", baselineId},
                               {"current", currentId},
                               {"added", result.summary.totalAdded},
                               {"removed", result.summary.totalRemoved},
                               {"changed", result.summary.totalChanged}}));
    return result;
}

DiffResult compareSnapshotFiles(const std::string &baselinePath,
                                const std::string &currentPath,
                                DiffStrategy strategy)
{
    logging::CorrelationScope corr(QUuid::createUuid().toString(QUuid::WithoutBraces));
    SDLOG_DEBUG(QStringLiteral("SnapshotComparison"),
                QStringLiteral("compareSnapshotFiles"),
                QStringLiteral("compare_start"),
                QStringLiteral("user_invocation"),
                QString::fromStdString(toStrategyString(strategy)),
                (nlohmann::json{{"baseline", baselinePath},
                                {"current", currentPath}}));

    Snapshot baseline;
    Snapshot current;
    try {
        // Both extensions are checked before any file is opened.
        const SnapshotFormat baselineFormat = detectFormat(baselinePath);
        const SnapshotFormat currentFormat = detectFormat(currentPath);
        baseline = loadSnapshotFile(baselinePath, baselineFormat);
        current = loadSnapshotFile(currentPath, currentFormat);
    } catch (const FileAccessError &error) {
        const std::string message = error.missing()
            ? std::string(error.what())
            : std::string("Comparison failed: ") + error.what();
        return failComparison(message, baselinePath, currentPath);
    } catch (const std::exception &error) {
        return failComparison(std::string("Comparison failed: ") + error.what(),
                              baselinePath, currentPath);
    }

    return compareSnapshots(baseline, current, baselinePath, currentPath, strategy);
}

} // namespace sysdelta
