#include "report/ReportCli.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <QFile>
#include <QFileInfo>
#include <QDir>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "core/save_event_builder.hpp"
#include "core/snapshot_builder.hpp"
#include "core/snapshot_differ.hpp"

namespace palchron {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  palchron-report snapshot --world PATH --out PATH [--save-file PATH] [--format markdown|json]\n"
        "  palchron-report diff --old PATH --new PATH [--format markdown|json]\n"
        "  palchron-report record --current PATH [--previous PATH] [--save-file PATH] [--format markdown|json]\n"
        "  palchron-report stats [--format markdown|json]\n"
        "  palchron-report session [--format markdown|json]\n"
        "  palchron-report trends [--format markdown|json]\n"
        "  palchron-report recent [--count N] [--format markdown|json]\n"
        "Options:\n"
        "  --history PATH  history file (default $PALCHRON_HISTORY_PATH or\n"
        "                  ~/.local/share/palchron/save_history.json)\n"
        "  --trace         also write debug lines to the trace log\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

std::string dumpJson(const nlohmann::json &payload)
{
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// One decimal, without touching the flags of the stream it is written to.
std::string oneDecimal(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

bool writeJsonFile(const QString &path, const nlohmann::json &payload)
{
    const QFileInfo info(path);
    if (!info.absolutePath().isEmpty()) {
        QDir().mkpath(info.absolutePath());
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(dumpJson(payload));
    if (file.write(data) != data.size()) {
        return false;
    }
    return true;
}

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

std::optional<Snapshot> readSnapshotFile(const QString &path)
{
    const nlohmann::json payload = readJsonFile(path);
    if (!payload.is_object()) {
        return std::nullopt;
    }
    try {
        return payload.get<Snapshot>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

std::string formatPriority(int priority)
{
    switch (priority) {
    case 1:
        return "high";
    case 2:
        return "medium";
    default:
        return "low";
    }
}

std::string upper(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return value;
}

void renderSnapshotMarkdown(const Snapshot &snapshot)
{
    std::cout << "# World Snapshot\n\n";
    std::cout << "Timestamp: " << snapshot.timestamp << "\n";
    if (snapshot.worldId.has_value()) {
        std::cout << "World ID: " << *snapshot.worldId << "\n";
    }
    if (snapshot.hostPlayer.has_value()) {
        std::cout << "Host: " << *snapshot.hostPlayer << "\n";
    }
    std::cout << "Players: " << snapshot.players.size() << "\n";
    for (const Player &player : snapshot.players) {
        std::cout << "- " << player.name << " (Lv." << player.level << ")"
                  << (player.isHost ? " [HOST]" : "") << "\n";
    }
    std::cout << "Creatures: " << snapshot.creatureCount << "\n";
    std::cout << "Bases: " << snapshot.bases.size() << "\n";
}

void renderEventsMarkdown(const std::vector<EventSummary> &events)
{
    if (events.empty()) {
        std::cout << "No changes detected.\n";
        return;
    }
    for (const EventSummary &event : events) {
        std::cout << "- [" << upper(toCategoryString(event.category)) << "] "
                  << event.message << " (" << formatPriority(event.priority) << ")\n";
    }
}

void renderRecordMarkdown(const SaveRecord &record)
{
    std::cout << "## Save at " << record.timestamp << "\n\n";
    std::cout << "- File: " << record.filePath << " (" << record.fileSize << " bytes, "
              << (record.fileSizeDelta >= 0 ? "+" : "") << record.fileSizeDelta << ")\n";
    std::cout << "- Since last save: " << oneDecimal(record.timeSinceLast) << "s\n";
    std::cout << "- Save type: " << toSaveTypeString(record.saveType) << "\n";
    std::cout << "- Activity: " << toActivityString(record.inferredActivity) << "\n\n";
    renderEventsMarkdown(record.events);
}

void renderPatternsMarkdown(const Patterns &patterns)
{
    std::cout << "## Patterns\n\n";
    std::cout << "- Average autosave interval: "
              << oneDecimal(patterns.avgAutosaveIntervalSeconds) << "s\n";
    std::cout << "- Average manual interval: "
              << oneDecimal(patterns.avgManualIntervalSeconds) << "s\n";
    std::cout << "- Activities:";
    for (const auto &[label, count] : patterns.activityDistribution) {
        std::cout << " " << toActivityString(label) << "=" << count;
    }
    std::cout << "\n- Event types:";
    for (const auto &[type, count] : patterns.eventTypeDistribution) {
        std::cout << " " << toEventTypeString(type) << "=" << count;
    }
    std::cout << "\n";
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    PLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("run"),
              QStringLiteral("report_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              palchron::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    if (command == QStringLiteral("snapshot")) {
        return runSnapshot(args);
    }
    if (command == QStringLiteral("diff")) {
        return runDiff(args);
    }
    if (command == QStringLiteral("record")) {
        return runRecord(args);
    }
    if (command == QStringLiteral("stats")) {
        return runStats(args);
    }
    if (command == QStringLiteral("session")) {
        return runSession(args);
    }
    if (command == QStringLiteral("trends")) {
        return runTrends(args);
    }
    if (command == QStringLiteral("recent")) {
        return runRecent(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

HistoryStore::Options ReportCli::historyOptions(const QStringList &args) const
{
    HistoryStore::Options options = HistoryStore::Options::fromEnvironment();
    const QString path = getArgValue(args, QStringLiteral("--history"));
    if (!path.isEmpty()) {
        options.path = path.toStdString();
    }
    return options;
}

int ReportCli::runSnapshot(const QStringList &args)
{
    // Convert an exported property tree into a snapshot file.
    const QString worldPath = getArgValue(args, QStringLiteral("--world"));
    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (worldPath.isEmpty() || outPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const nlohmann::json tree = readJsonFile(worldPath);
    if (tree.is_null()) {
        std::cerr << "Could not read world data: " << worldPath.toStdString() << std::endl;
        return 1;
    }

    QString saveFile = getArgValue(args, QStringLiteral("--save-file"));
    if (saveFile.isEmpty()) {
        saveFile = worldPath;
    }

    const auto raw = worldStateFromPropertyTree(tree, saveFile.toStdString());
    if (!raw.has_value()) {
        std::cerr << "World data has no worldSaveData section." << std::endl;
        return 1;
    }

    const Snapshot snapshot = buildSnapshot(*raw);
    if (!writeJsonFile(outPath, snapshot)) {
        std::cerr << "Failed to write snapshot: " << outPath.toStdString() << std::endl;
        return 1;
    }

    PLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runSnapshot"),
              QStringLiteral("snapshot_written"),
              QStringLiteral("user_invocation"),
              QStringLiteral("json_file"),
              palchron::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"out", outPath.toStdString()},
                              {"creatures", snapshot.creatureCount},
                              {"players", snapshot.players.size()}}));

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << dumpJson(snapshot) << std::endl;
    } else {
        renderSnapshotMarkdown(snapshot);
    }
    return 0;
}

int ReportCli::runDiff(const QStringList &args)
{
    const QString oldPath = getArgValue(args, QStringLiteral("--old"));
    const QString newPath = getArgValue(args, QStringLiteral("--new"));
    if (oldPath.isEmpty() || newPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const auto oldSnapshot = readSnapshotFile(oldPath);
    const auto newSnapshot = readSnapshotFile(newPath);
    if (!oldSnapshot.has_value() || !newSnapshot.has_value()) {
        std::cerr << "Snapshot not found or unreadable." << std::endl;
        return 1;
    }

    const std::vector<Event> events = diffSnapshots(*oldSnapshot, *newSnapshot);

    if (getFormat(args) == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["old"] = oldSnapshot->timestamp;
        payload["new"] = newSnapshot->timestamp;
        payload["events"] = events;
        std::cout << dumpJson(payload) << std::endl;
    } else {
        std::cout << "# Snapshot Diff\n\n";
        std::cout << "From: " << oldSnapshot->timestamp << "\n";
        std::cout << "To:   " << newSnapshot->timestamp << "\n\n";
        renderEventsMarkdown(summarizeEvents(events));
    }
    return 0;
}

int ReportCli::runRecord(const QStringList &args)
{
    // Record one observed save: diff against the previous snapshot, classify
    // and append the result to the history.
    const QString currentPath = getArgValue(args, QStringLiteral("--current"));
    if (currentPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    auto current = readSnapshotFile(currentPath);
    if (!current.has_value()) {
        std::cerr << "Snapshot not found or unreadable." << std::endl;
        return 1;
    }

    std::optional<Snapshot> previous;
    const QString previousPath = getArgValue(args, QStringLiteral("--previous"));
    if (!previousPath.isEmpty()) {
        previous = readSnapshotFile(previousPath);
        if (!previous.has_value()) {
            std::cerr << "Previous snapshot not found or unreadable." << std::endl;
            return 1;
        }
    }

    QString saveFile = getArgValue(args, QStringLiteral("--save-file"));
    if (saveFile.isEmpty()) {
        saveFile = QString::fromStdString(current->filePath);
    }

    palchron::logging::CorrelationScope scope(palchron::logging::saveCorrelationId(
        saveFile, QString::fromStdString(current->timestamp)));

    HistoryStore store(historyOptions(args));
    const auto last = store.lastRecord();

    int64_t previousFileSize = 0;
    std::optional<std::string> previousTimestamp;
    if (last.has_value()) {
        previousFileSize = last->fileSize;
        previousTimestamp = last->timestamp;
    } else if (previous.has_value()) {
        previousTimestamp = previous->timestamp;
    }

    const SaveEvent event = buildSaveEvent(std::move(*current),
                                           previous.has_value() ? &*previous : nullptr,
                                           saveFile.toStdString(),
                                           previousFileSize,
                                           previousTimestamp);
    if (!store.append(event)) {
        std::cerr << "Failed to write history: " << store.path() << std::endl;
        return 1;
    }

    const SaveRecord record = toSaveRecord(event);
    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << dumpJson(record) << std::endl;
    } else {
        renderRecordMarkdown(record);
    }
    return 0;
}

int ReportCli::runStats(const QStringList &args)
{
    HistoryStore store(historyOptions(args));
    const auto stats = store.stats();
    const bool json = getFormat(args) == QStringLiteral("json");

    if (!stats.has_value()) {
        if (json) {
            std::cout << dumpJson(nlohmann::json{{"message", "No history yet"}}) << std::endl;
        } else {
            std::cout << "No history yet\n";
        }
        return 0;
    }

    if (json) {
        std::cout << dumpJson(*stats) << std::endl;
        return 0;
    }

    std::cout << "# Save History Stats\n\n";
    std::cout << "- Total saves: " << stats->totalSaves << "\n";
    std::cout << "- Creatures caught: " << stats->totalCreaturesCaught << "\n";
    std::cout << "- Creatures released: " << stats->totalCreaturesReleased << "\n";
    std::cout << "- Level ups: " << stats->totalLevelUps << "\n";
    std::cout << "- Bases built: " << stats->totalBasesBuilt << "\n\n";
    renderPatternsMarkdown(stats->patterns);
    return 0;
}

int ReportCli::runSession(const QStringList &args)
{
    HistoryStore store(historyOptions(args));
    const auto summary = store.sessionSummary();
    const bool json = getFormat(args) == QStringLiteral("json");

    if (!summary.has_value()) {
        if (json) {
            std::cout << dumpJson(nlohmann::json{{"message", "No session data available"}})
                      << std::endl;
        } else {
            std::cout << "No session data available\n";
        }
        return 0;
    }

    if (json) {
        std::cout << dumpJson(*summary) << std::endl;
        return 0;
    }

    std::cout << "# Session Summary\n\n";
    std::cout << "- From: " << summary->startTime << "\n";
    std::cout << "- To: " << summary->endTime << "\n";
    std::cout << "- Duration: " << oneDecimal(summary->durationMinutes) << " minutes\n";
    std::cout << "- Saves: " << summary->saveCount << "\n";
    std::cout << "- Creatures caught: " << summary->creaturesCaught << "\n";
    std::cout << "- Creatures released: " << summary->creaturesReleased << "\n";
    std::cout << "- Level ups: " << summary->levelUps << "\n";
    std::cout << "- Bases built: " << summary->basesBuilt << "\n";
    std::cout << "- Primary activity: " << toActivityString(summary->primaryActivity) << "\n";
    return 0;
}

int ReportCli::runTrends(const QStringList &args)
{
    HistoryStore store(historyOptions(args));
    const std::vector<std::string> trends = store.detectTrends();

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << dumpJson(nlohmann::json{{"trends", trends}}) << std::endl;
        return 0;
    }

    std::cout << "# Trends\n\n";
    for (const std::string &trend : trends) {
        std::cout << "- " << trend << "\n";
    }
    return 0;
}

int ReportCli::runRecent(const QStringList &args)
{
    size_t count = 10;
    const QString countValue = getArgValue(args, QStringLiteral("--count"));
    if (!countValue.isEmpty()) {
        bool ok = false;
        const int parsed = countValue.toInt(&ok);
        if (!ok || parsed <= 0) {
            std::cerr << "Invalid --count. Use a positive integer." << std::endl;
            return 1;
        }
        count = static_cast<size_t>(parsed);
    }

    HistoryStore store(historyOptions(args));
    const std::vector<SaveRecord> records = store.recentEvents(count);

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << dumpJson(nlohmann::json{{"events", records}}) << std::endl;
        return 0;
    }

    std::cout << "# Recent Saves\n\n";
    if (records.empty()) {
        std::cout << "No history yet\n";
        return 0;
    }
    for (const SaveRecord &record : records) {
        renderRecordMarkdown(record);
        std::cout << "\n";
    }
    return 0;
}

} // namespace palchron
