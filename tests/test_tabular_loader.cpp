#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "snapshot/csv_codec.hpp"
#include "snapshot/tabular_loader.hpp"

using sysdelta::Snapshot;

class TabularLoaderTests : public QObject
{
    Q_OBJECT
private slots:
    void testStructuredRows();
    void testMetricVariantIgnoresUnit();
    void testQuotedFields();
    void testMissingComponentFails();
    void testMissingPropertyFails();
    void testMissingValueIsEmpty();
    void testKeyValueRowsBecomePaths();
    void testFallbackGroupsByComponent();
    void testEmptyInput();
    void testCrlfAndBom();
    void testUnterminatedQuoteFails();
    void testFormatRowQuoting();
    void testLoadFile();
};

static bool throwsMalformed(const std::string &content)
{
    try {
        sysdelta::loadTabularSnapshot(content);
    } catch (const sysdelta::MalformedInputError &) {
        return true;
    }
    return false;
}

void TabularLoaderTests::testStructuredRows()
{
    const Snapshot snapshot = sysdelta::loadTabularSnapshot(
        "Component,Property,Value\n"
        "CPU,cores,4\n"
        "CPU,model,Xeon\n"
        "RAM,total,16000\n");

    QVERIFY(snapshot == Snapshot::parse(
        R"({"CPU": {"cores": "4", "model": "Xeon"}, "RAM": {"total": "16000"}})"));
    QVERIFY(snapshot["CPU"]["cores"].is_string());
}

void TabularLoaderTests::testMetricVariantIgnoresUnit()
{
    const Snapshot snapshot = sysdelta::loadTabularSnapshot(
        "Component,Metric,Value,Unit\n"
        "CPU,core0,12.5,%\n"
        "RAM,used,2048,MB\n");

    QVERIFY(snapshot == Snapshot::parse(
        R"({"CPU": {"core0": "12.5"}, "RAM": {"used": "2048"}})"));

    const Snapshot sensors = sysdelta::loadTabularSnapshot(
        "Component,Sensor,Value,Unit\nSensor,cpu_temp,45,\xC2\xB0" "C\n");
    QCOMPARE(QString::fromStdString(sensors["Sensor"]["cpu_temp"].get<std::string>()),
             QStringLiteral("45"));
}

void TabularLoaderTests::testQuotedFields()
{
    const Snapshot snapshot = sysdelta::loadTabularSnapshot(
        "Component,Property,Value\n"
        "\"GPU\",\"name\",\"NVIDIA, Inc \"\"RTX\"\"\"\n"
        "GPU,notes,\"line one\nline two\"\n");

    QCOMPARE(QString::fromStdString(snapshot["GPU"]["name"].get<std::string>()),
             QStringLiteral("NVIDIA, Inc \"RTX\""));
    QCOMPARE(QString::fromStdString(snapshot["GPU"]["notes"].get<std::string>()),
             QStringLiteral("line one\nline two"));
}

void TabularLoaderTests::testMissingComponentFails()
{
    QVERIFY(throwsMalformed("Component,Property,Value\n,cores,4\n"));
}

void TabularLoaderTests::testMissingPropertyFails()
{
    QVERIFY(throwsMalformed("Component,Property,Value\nCPU,,4\n"));
    QVERIFY(throwsMalformed("Component,Property,Value\nCPU\n"));
}

void TabularLoaderTests::testMissingValueIsEmpty()
{
    const Snapshot snapshot = sysdelta::loadTabularSnapshot(
        "Component,Property,Value\nBattery,percent\n");
    QVERIFY(snapshot["Battery"]["percent"].is_string());
    QVERIFY(snapshot["Battery"]["percent"].get<std::string>().empty());
}

void TabularLoaderTests::testKeyValueRowsBecomePaths()
{
    const auto rows = sysdelta::parseCsv("Key,Value\nCPU.cores,4\nDisk[0].size,500\n");
    QVERIFY(!sysdelta::tryStructuredLoad(rows).has_value());

    const auto paths = sysdelta::tryKeyValueLoad(rows);
    QVERIFY(paths.has_value());
    QVERIFY(*paths == Snapshot::parse(R"({"CPU.cores": "4", "Disk[0].size": "500"})"));
    QVERIFY(sysdelta::loadTabularSnapshot("Key,Value\nCPU.cores,4\nDisk[0].size,500\n")
            == *paths);

    // The fallback tier on its own still files rows by position.
    QVERIFY(sysdelta::fallbackFlattenLoad(rows) == Snapshot::parse(R"({
        "row_0": {"Key": "CPU.cores", "Value": "4"},
        "row_1": {"Key": "Disk[0].size", "Value": "500"}
    })"));

    // A Component column means a component table, not a path table.
    const auto componentRows = sysdelta::parseCsv("Component,Key,Value\nCPU,cores,4\n");
    QVERIFY(!sysdelta::tryKeyValueLoad(componentRows).has_value());
    QVERIFY(!sysdelta::tryKeyValueLoad(sysdelta::parseCsv("Name,Value\na,1\n")).has_value());
}

void TabularLoaderTests::testFallbackGroupsByComponent()
{
    const Snapshot snapshot = sysdelta::loadTabularSnapshot(
        "Component,Speed,Unit\n"
        "Disk,100,MB/s\n"
        ",7,\n");

    QVERIFY(snapshot == Snapshot::parse(R"({
        "Disk": {"Speed": "100", "Unit": "MB/s"},
        "row_1": {"Speed": "7", "Unit": ""}
    })"));
}

void TabularLoaderTests::testEmptyInput()
{
    QVERIFY(sysdelta::loadTabularSnapshot("") == Snapshot::object());
    QVERIFY(sysdelta::loadTabularSnapshot("Component,Property,Value\n") == Snapshot::object());
    QVERIFY(sysdelta::parseCsv("\n\n").empty());
}

void TabularLoaderTests::testCrlfAndBom()
{
    const Snapshot snapshot = sysdelta::loadTabularSnapshot(
        "\xEF\xBB\xBF" "Component,Property,Value\r\n"
        "OS,system,Linux\r\n"
        "\r\n"
        "OS,release,6.8.0\r\n");

    QVERIFY(snapshot == Snapshot::parse(
        R"({"OS": {"system": "Linux", "release": "6.8.0"}})"));
}

void TabularLoaderTests::testUnterminatedQuoteFails()
{
    QVERIFY(throwsMalformed("Component,Property,Value\nCPU,model,\"Xeon\n"));
}

void TabularLoaderTests::testFormatRowQuoting()
{
    QCOMPARE(QString::fromStdString(sysdelta::formatCsvRow({"CPU", "cores", "4"})),
             QStringLiteral("CPU,cores,4\n"));
    QCOMPARE(QString::fromStdString(sysdelta::formatCsvRow({"a,b", "say \"hi\"", ""})),
             QStringLiteral("\"a,b\",\"say \"\"hi\"\"\",\n"));

    const auto rows = sysdelta::parseCsv(sysdelta::formatCsvRow({"a,b", "say \"hi\"", "x\ny"}));
    QCOMPARE(rows.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(rows.front().at(1)), QStringLiteral("say \"hi\""));
    QCOMPARE(QString::fromStdString(rows.front().at(2)), QStringLiteral("x\ny"));
}

void TabularLoaderTests::testLoadFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.path() + "/specs.csv";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("Component,Property,Value\nCPU,cores,8\n");
    file.close();

    const Snapshot snapshot = sysdelta::loadTabularFile(path.toStdString());
    QCOMPARE(QString::fromStdString(snapshot["CPU"]["cores"].get<std::string>()),
             QStringLiteral("8"));
}

QTEST_MAIN(TabularLoaderTests)
#include "test_tabular_loader.moc"
