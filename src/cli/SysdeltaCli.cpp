#include "cli/SysdeltaCli.hpp"

#include <iostream>
#include <utility>

#include <QDateTime>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "diff/snapshot_comparison.hpp"
#include "snapshot/flattener.hpp"
#include "snapshot/snapshot_collector.hpp"
#include "snapshot/snapshot_exporter.hpp"
#include "snapshot/snapshot_reader.hpp"

namespace sysdelta {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  sysdelta specs [--os] [--cpu] [--ram] [--disk] [--format json|csv] [--out PATH|auto]\n"
        "  sysdelta compare --baseline PATH --current PATH [--flat] [--format json|markdown]\n"
        "  sysdelta flatten --input PATH [--format csv|json]\n"
        "\n"
        "Global options:\n"
        "  --trace    write debug events to the trace log\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args, const QString &fallback)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return fallback;
    }
    return value.toLower();
}

// CSV cells are taken byte for byte and may not be UTF-8 (e.g. a cp1252
// degree sign); invalid sequences are printed as U+FFFD.
std::string dumpReplacingInvalid(const Snapshot &value)
{
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string renderValue(const Snapshot &value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void renderCompareMarkdown(const DiffResult &result)
{
    std::cout << "# sysdelta Comparison Report\n\n";
    std::cout << "Baseline: " << result.summary.baselineFile << "\n";
    std::cout << "Current:  " << result.summary.currentFile << "\n\n";

    if (result.error.has_value()) {
        std::cout << *result.error << "\n";
        return;
    }

    std::cout << "Added: " << result.summary.totalAdded
              << ", Removed: " << result.summary.totalRemoved
              << ", Changed: " << result.summary.totalChanged << "\n";

    if (result.added.empty() && result.removed.empty() && result.changed.empty()) {
        std::cout << "\nNo differences between snapshots.\n";
        return;
    }

    if (!result.added.empty()) {
        std::cout << "\n## Added\n\n";
        for (const auto &item : result.added.items()) {
            std::cout << "- " << item.key() << ": " << renderValue(item.value()) << "\n";
        }
    }
    if (!result.removed.empty()) {
        std::cout << "\n## Removed\n\n";
        for (const auto &item : result.removed.items()) {
            std::cout << "- " << item.key() << ": " << renderValue(item.value()) << "\n";
        }
    }
    if (!result.changed.empty()) {
        std::cout << "\n## Changed\n\n";
        for (const auto &item : result.changed.items()) {
            std::cout << "- " << item.key() << ": "
                      << renderValue(item.value().at("from")) << " -> "
                      << renderValue(item.value().at("to")) << "\n";
        }
    }
}

} // namespace

SysdeltaCli::SysdeltaCli(AppConfig config)
    : m_config(std::move(config))
{
}

int SysdeltaCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        args.push_back(arg);
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    SDLOG_INFO(QStringLiteral("SysdeltaCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               (nlohmann::json{{"command", command.toStdString()}}));
    if (command == QStringLiteral("specs")) {
        return runSpecs(args);
    }
    if (command == QStringLiteral("compare")) {
        return runCompare(args);
    }
    if (command == QStringLiteral("flatten")) {
        return runFlatten(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int SysdeltaCli::runSpecs(const QStringList &args)
{
    // Without component flags every component is collected.
    CollectOptions options;
    const bool anySelected = args.contains(QStringLiteral("--os"))
        || args.contains(QStringLiteral("--cpu"))
        || args.contains(QStringLiteral("--ram"))
        || args.contains(QStringLiteral("--disk"));
    if (anySelected) {
        options.os = args.contains(QStringLiteral("--os"));
        options.cpu = args.contains(QStringLiteral("--cpu"));
        options.ram = args.contains(QStringLiteral("--ram"));
        options.disk = args.contains(QStringLiteral("--disk"));
    }

    const auto format = parseExportFormat(getFormat(args, QStringLiteral("json")).toStdString());
    if (!format.has_value()) {
        std::cerr << "Invalid format. Use json or csv." << std::endl;
        return 1;
    }

    const Snapshot snapshot = collectSystemSpecs(options);

    const QString out = getArgValue(args, QStringLiteral("--out"));
    if (out.isEmpty()) {
        std::cout << (*format == ExportFormat::Json ? exportJson(snapshot)
                                                    : exportCsv(snapshot));
        return 0;
    }

    const std::string target = out == QStringLiteral("auto")
        ? defaultExportPath(*format, QDateTime::currentDateTime(),
                            m_config.exportDirectory.toStdString())
        : out.toStdString();
    try {
        const std::string written = exportSnapshotToFile(snapshot, *format, target);
        std::cout << "Export completed: " << written << std::endl;
    } catch (const SnapshotError &ex) {
        std::cerr << "Error exporting to file: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int SysdeltaCli::runCompare(const QStringList &args)
{
    const QString baselinePath = getArgValue(args, QStringLiteral("--baseline"));
    const QString currentPath = getArgValue(args, QStringLiteral("--current"));

    if (baselinePath.isEmpty() || currentPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args, QStringLiteral("json"));
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const DiffStrategy strategy = args.contains(QStringLiteral("--flat"))
        ? DiffStrategy::Flat
        : DiffStrategy::Nested;

    // Load failures come back as error entries, so there is one rendering path.
    const DiffResult result = compareSnapshotFiles(baselinePath.toStdString(),
                                                   currentPath.toStdString(),
                                                   strategy);
    if (format == QStringLiteral("json")) {
        std::cout << dumpReplacingInvalid(Snapshot(result)) << std::endl;
    } else {
        renderCompareMarkdown(result);
    }
    return 0;
}

int SysdeltaCli::runFlatten(const QStringList &args)
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args, QStringLiteral("csv"));
    if (format != QStringLiteral("csv") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use csv or json." << std::endl;
        return 1;
    }

    Snapshot snapshot;
    try {
        snapshot = loadSnapshotFile(inputPath.toStdString());
    } catch (const SnapshotError &ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    if (format == QStringLiteral("csv")) {
        std::cout << exportCsv(snapshot, ExportLayout::Flat);
        return 0;
    }

    Snapshot flat = Snapshot::object();
    for (const auto &entry : flatten(snapshot)) {
        flat[entry.path] = entry.value;
    }
    std::cout << dumpReplacingInvalid(flat) << std::endl;
    return 0;
}

} // namespace sysdelta
