#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <filesystem>
#include <sstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "report/ReportCli.hpp"
#include "common/json_utils.hpp"

class ReportCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testUsageOnBadArguments();
    void testSnapshotFromWorldTree();
    void testDiffJson();
    void testDiffMarkdown();
    void testRecordAndReports();
    void testEmptyHistoryReports();
    void testMarkdownLeavesStreamFormatting();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetHistory();
    QString historyPath() const;
    QString writeSnapshot(const QString &name, const palchron::Snapshot &snapshot) const;
    int runCli(const QStringList &args, std::string &out);
};

void ReportCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("PALCHRON_HISTORY_PATH");
    qunsetenv("PALCHRON_MAX_EVENTS");
}

void ReportCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString ReportCliTests::historyPath() const
{
    return m_tempDir.path() + QStringLiteral("/history.json");
}

void ReportCliTests::resetHistory()
{
    QFile::remove(historyPath());
}

QString ReportCliTests::writeSnapshot(const QString &name, const palchron::Snapshot &snapshot) const
{
    const QString path = m_tempDir.path() + QStringLiteral("/") + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QByteArray::fromStdString(nlohmann::json(snapshot).dump()));
    }
    return path;
}

int ReportCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    palchron::ReportCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ReportCliTests::testUsageOnBadArguments()
{
    std::string output;
    QCOMPARE(runCli({"palchron-report"}, output), 1);
    QVERIFY(output.find("Usage:") != std::string::npos);

    QCOMPARE(runCli({"palchron-report", "teleport"}, output), 1);
    QCOMPARE(runCli({"palchron-report", "diff", "--old", "a.json"}, output), 1);
    QCOMPARE(runCli({"palchron-report", "stats", "--format", "xml"}, output), 1);
    QCOMPARE(runCli({"palchron-report", "recent", "--count", "zero",
                     "--history", historyPath()}, output), 1);
    QCOMPARE(runCli({"palchron-report", "diff",
                     "--old", m_tempDir.path() + "/missing-a.json",
                     "--new", m_tempDir.path() + "/missing-b.json"}, output), 1);
}

void ReportCliTests::testSnapshotFromWorldTree()
{
    auto wrap = [](const nlohmann::json &value) { return nlohmann::json{{"value", value}}; };
    const nlohmann::json host = {
        {"key", {{"PlayerUId", wrap("00000000-0000-0000-0000-000000000001")}}},
        {"value", {{"RawData", wrap({{"object", {{"SaveParameter", wrap({
            {"IsPlayer", wrap(true)}, {"NickName", wrap("Ash")}, {"Level", wrap(9)}
        })}}}})}}}
    };
    const nlohmann::json tree = {
        {"properties", {{"worldSaveData", wrap({
            {"CharacterSaveParameterMap", wrap(nlohmann::json::array({host}))},
            {"BaseCampSaveData", wrap(nlohmann::json::array({nlohmann::json::object()}))}
        })}}}
    };

    const QString worldPath = m_tempDir.path() + QStringLiteral("/world.json");
    QFile worldFile(worldPath);
    QVERIFY(worldFile.open(QIODevice::WriteOnly | QIODevice::Truncate));
    worldFile.write(QByteArray::fromStdString(tree.dump()));
    worldFile.close();

    const QString outPath = m_tempDir.path() + QStringLiteral("/snapshots/current.json");
    std::string output;
    const int code = runCli({"palchron-report", "snapshot",
                             "--world", worldPath,
                             "--save-file", "/games/SaveGames/1/WORLD9/Level.sav",
                             "--out", outPath,
                             "--format", "json"}, output);
    QCOMPARE(code, 0);
    QVERIFY(QFile::exists(outPath));

    const auto parsed = nlohmann::json::parse(output).get<palchron::Snapshot>();
    QCOMPARE(parsed.players.size(), static_cast<size_t>(1));
    QVERIFY(parsed.players.front().isHost);
    QCOMPARE(parsed.bases.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(parsed.worldId.value_or("")), QStringLiteral("WORLD9"));
    QCOMPARE(QString::fromStdString(parsed.hostPlayer.value_or("")), QStringLiteral("Ash"));

    const QString emptyPath = m_tempDir.path() + QStringLiteral("/empty.json");
    QFile emptyFile(emptyPath);
    QVERIFY(emptyFile.open(QIODevice::WriteOnly | QIODevice::Truncate));
    emptyFile.write("{}");
    emptyFile.close();
    QCOMPARE(runCli({"palchron-report", "snapshot", "--world", emptyPath, "--out", outPath},
                    output), 1);
}

void ReportCliTests::testDiffJson()
{
    palchron::Snapshot before;
    before.timestamp = "2024-02-01T10:00:00Z";
    palchron::Snapshot after = before;
    after.timestamp = "2024-02-01T10:10:00Z";
    after.bases = {palchron::Base{"0", "Base 1"}};

    const QString oldPath = writeSnapshot(QStringLiteral("before.json"), before);
    const QString newPath = writeSnapshot(QStringLiteral("after.json"), after);

    std::string output;
    const int code = runCli({"palchron-report", "diff", "--old", oldPath, "--new", newPath,
                             "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.contains("events"));
    QCOMPARE(parsed.at("events").size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(parsed.at("events").at(0).value("type", "")),
             QStringLiteral("base_created"));
}

void ReportCliTests::testDiffMarkdown()
{
    palchron::Snapshot snapshot;
    snapshot.timestamp = "2024-02-01T10:00:00Z";
    const QString path = writeSnapshot(QStringLiteral("same.json"), snapshot);

    std::string output;
    QCOMPARE(runCli({"palchron-report", "diff", "--old", path, "--new", path}, output), 0);
    QVERIFY(output.find("No changes detected.") != std::string::npos);
}

void ReportCliTests::testRecordAndReports()
{
    resetHistory();

    palchron::Snapshot first;
    first.timestamp = "2024-02-01T10:00:00Z";
    first.filePath = "/games/Level.sav";

    palchron::Creature lamball;
    lamball.instanceId = "A";
    lamball.species = "Lamball";
    palchron::Creature cattiva;
    cattiva.instanceId = "B";
    cattiva.species = "Cattiva";

    palchron::Snapshot second = first;
    second.timestamp = "2024-02-01T10:10:00Z";
    second.creatures = {lamball, cattiva};
    second.creatureCount = 2;

    const QString firstPath = writeSnapshot(QStringLiteral("first.json"), first);
    const QString secondPath = writeSnapshot(QStringLiteral("second.json"), second);

    std::string output;
    QCOMPARE(runCli({"palchron-report", "record", "--current", firstPath,
                     "--history", historyPath(), "--format", "json"}, output), 0);
    auto recorded = nlohmann::json::parse(output);
    QCOMPARE(QString::fromStdString(recorded.value("save_type", "")), QStringLiteral("unknown"));
    QCOMPARE(QString::fromStdString(recorded.value("inferred_activity", "")), QStringLiteral("idle"));

    QCOMPARE(runCli({"palchron-report", "record", "--current", secondPath,
                     "--previous", firstPath,
                     "--history", historyPath(), "--format", "json"}, output), 0);
    recorded = nlohmann::json::parse(output);
    QCOMPARE(recorded.value("time_since_last", 0.0), 600.0);
    QCOMPARE(QString::fromStdString(recorded.value("save_type", "")), QStringLiteral("autosave"));
    QCOMPARE(QString::fromStdString(recorded.value("inferred_activity", "")),
             QStringLiteral("catching"));
    QCOMPARE(recorded.at("events").size(), static_cast<size_t>(2));
    QVERIFY(QFile::exists(historyPath()));

    QCOMPARE(runCli({"palchron-report", "stats", "--history", historyPath(),
                     "--format", "json"}, output), 0);
    const auto stats = nlohmann::json::parse(output);
    QCOMPARE(stats.value("total_saves", 0), 2);
    QCOMPARE(stats.value("total_creatures_caught", 0), 2);

    QCOMPARE(runCli({"palchron-report", "session", "--history", historyPath(),
                     "--format", "json"}, output), 0);
    const auto session = nlohmann::json::parse(output);
    QCOMPARE(session.value("save_count", 0), 2);
    QCOMPARE(session.value("duration_minutes", 0.0), 10.0);

    QCOMPARE(runCli({"palchron-report", "trends", "--history", historyPath(),
                     "--format", "json"}, output), 0);
    const auto trends = nlohmann::json::parse(output);
    QCOMPARE(QString::fromStdString(trends.at("trends").at(0).get<std::string>()),
             QString::fromLatin1(palchron::kNotEnoughDataMessage));

    QCOMPARE(runCli({"palchron-report", "recent", "--count", "1", "--history", historyPath(),
                     "--format", "json"}, output), 0);
    const auto recent = nlohmann::json::parse(output);
    QCOMPARE(recent.at("events").size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(recent.at("events").at(0).value("timestamp", "")),
             QStringLiteral("2024-02-01T10:10:00Z"));

    QCOMPARE(runCli({"palchron-report", "stats", "--history", historyPath()}, output), 0);
    QVERIFY(output.find("Total saves: 2") != std::string::npos);
}

void ReportCliTests::testEmptyHistoryReports()
{
    resetHistory();

    std::string output;
    QCOMPARE(runCli({"palchron-report", "stats", "--history", historyPath()}, output), 0);
    QVERIFY(output.find("No history yet") != std::string::npos);

    QCOMPARE(runCli({"palchron-report", "session", "--history", historyPath()}, output), 0);
    QVERIFY(output.find("No session data available") != std::string::npos);

    QVERIFY(!QFile::exists(historyPath()));
}

void ReportCliTests::testMarkdownLeavesStreamFormatting()
{
    resetHistory();

    palchron::Snapshot first;
    first.timestamp = "2024-02-01T10:00:00Z";
    palchron::Snapshot second = first;
    second.timestamp = "2024-02-01T10:10:00Z";

    const QString firstPath = writeSnapshot(QStringLiteral("format-first.json"), first);
    const QString secondPath = writeSnapshot(QStringLiteral("format-second.json"), second);

    std::string output;
    QCOMPARE(runCli({"palchron-report", "record", "--current", firstPath,
                     "--history", historyPath()}, output), 0);
    QCOMPARE(runCli({"palchron-report", "record", "--current", secondPath,
                     "--previous", firstPath, "--history", historyPath()}, output), 0);
    QVERIFY(output.find("Since last save: 600.0s") != std::string::npos);

    QCOMPARE(runCli({"palchron-report", "stats", "--history", historyPath()}, output), 0);
    QCOMPARE(runCli({"palchron-report", "session", "--history", historyPath()}, output), 0);
    QVERIFY(output.find("Duration: 10.0 minutes") != std::string::npos);

    QVERIFY(!(std::cout.flags() & std::ios_base::floatfield));
    QCOMPARE(std::cout.precision(), static_cast<std::streamsize>(6));
}

QTEST_MAIN(ReportCliTests)
#include "test_report_cli.moc"
