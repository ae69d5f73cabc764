#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testSnapshotRoundTrip();
    void testSaveEventPersistsSummaryOnly();
    void testSaveRecordRoundTrip();
    void testPatternsRoundTrip();
    void testLegacyNames();
    void testMissingFieldsDefaults();
    void testIso8601Parsing();
};

void ModelsJsonTests::testSnapshotRoundTrip()
{
    palchron::Snapshot snapshot;
    snapshot.timestamp = "2024-02-01T10:00:00Z";
    snapshot.filePath = "/saves/ABC/Level.sav";
    snapshot.players = {palchron::Player{"00000000-0000-0000-0000-000000000001", "Ash", 12, true}};

    palchron::Creature creature;
    creature.instanceId = "A1";
    creature.species = "Lamball";
    creature.level = 5;
    creature.exp = 1200;
    creature.hpIv = 70;
    creature.defIv = 20;
    creature.atkIv = 55;
    creature.gender = palchron::Gender::Female;
    creature.passives = {"Swift", "Lucky"};
    creature.ownerUid = "00000000-0000-0000-0000-000000000001";
    creature.nickname = std::string("Fluff");
    snapshot.creatures = {creature};
    snapshot.bases = {palchron::Base{"0", "Base 1"}};
    snapshot.creatureCount = 1;
    snapshot.gameTime = 638400000000LL;
    snapshot.worldId = std::string("ABC");
    snapshot.hostPlayer = std::string("Ash");

    nlohmann::json j = snapshot;
    QVERIFY(j.contains("creature_count"));
    QVERIFY(j.at("creatures").at(0).contains("hp_iv"));

    const auto parsed = j.get<palchron::Snapshot>();
    QCOMPARE(QString::fromStdString(parsed.timestamp), QStringLiteral("2024-02-01T10:00:00Z"));
    QCOMPARE(parsed.players.size(), static_cast<size_t>(1));
    QVERIFY(parsed.players.front().isHost);
    QCOMPARE(parsed.creatures.size(), static_cast<size_t>(1));
    QCOMPARE(parsed.creatures.front().gender, palchron::Gender::Female);
    QCOMPARE(parsed.creatures.front().exp, static_cast<int64_t>(1200));
    QCOMPARE(parsed.creatures.front().passives.size(), static_cast<size_t>(2));
    QVERIFY(parsed.creatures.front().nickname.has_value());
    QCOMPARE(QString::fromStdString(*parsed.creatures.front().nickname), QStringLiteral("Fluff"));
    QCOMPARE(parsed.bases.size(), static_cast<size_t>(1));
    QCOMPARE(parsed.creatureCount, 1);
    QVERIFY(parsed.gameTime.has_value());
    QCOMPARE(*parsed.gameTime, static_cast<int64_t>(638400000000LL));
    QCOMPARE(QString::fromStdString(parsed.worldId.value_or("")), QStringLiteral("ABC"));
    QCOMPARE(QString::fromStdString(parsed.hostPlayer.value_or("")), QStringLiteral("Ash"));
}

void ModelsJsonTests::testSaveEventPersistsSummaryOnly()
{
    auto snapshot = std::make_shared<palchron::Snapshot>();
    snapshot->timestamp = "2024-02-01T10:00:00Z";
    snapshot->creatures.resize(3);
    snapshot->creatureCount = 3;
    snapshot->players = {palchron::Player{"p1", "Ash", 3, false}};

    palchron::SaveEvent event;
    event.timestamp = snapshot->timestamp;
    event.filePath = "/saves/Level.sav";
    event.fileSize = 2048;
    event.fileSizeDelta = 48;
    event.timeSinceLast = 600.0;
    event.saveType = palchron::SaveType::Autosave;
    event.inferredActivity = palchron::ActivityLabel::Idle;
    event.snapshot = snapshot;

    const nlohmann::json j = event;
    QVERIFY(!j.contains("snapshot"));
    QVERIFY(j.contains("snapshot_summary"));
    QCOMPARE(j.at("snapshot_summary").value("creature_count", 0), 3);
    QCOMPARE(j.at("snapshot_summary").value("player_count", 0), 1);
    QCOMPARE(j.at("snapshot_summary").value("base_count", -1), 0);
    QCOMPARE(QString::fromStdString(j.value("save_type", "")), QStringLiteral("autosave"));
}

void ModelsJsonTests::testSaveRecordRoundTrip()
{
    palchron::SaveRecord record;
    record.timestamp = "2024-02-01T10:10:00Z";
    record.filePath = "/saves/Level.sav";
    record.fileSize = 4096;
    record.fileSizeDelta = -12;
    record.timeSinceLast = 65.5;
    record.saveType = palchron::SaveType::Manual;
    record.events = {palchron::EventSummary{palchron::EventType::CreatureCaught,
                                            palchron::EventCategory::Creature,
                                            "Caught Foxparks Lv.3 (IVs: 1/2/3 = 6)", 2}};
    record.inferredActivity = palchron::ActivityLabel::Catching;

    const nlohmann::json j = record;
    const auto parsed = j.get<palchron::SaveRecord>();
    QCOMPARE(parsed.fileSize, static_cast<int64_t>(4096));
    QCOMPARE(parsed.fileSizeDelta, static_cast<int64_t>(-12));
    QCOMPARE(parsed.timeSinceLast, 65.5);
    QCOMPARE(parsed.saveType, palchron::SaveType::Manual);
    QCOMPARE(parsed.inferredActivity, palchron::ActivityLabel::Catching);
    QCOMPARE(parsed.events.size(), static_cast<size_t>(1));
    QCOMPARE(parsed.events.front().type, palchron::EventType::CreatureCaught);
    QCOMPARE(parsed.events.front().priority, 2);
    QVERIFY(!parsed.snapshotSummary.has_value());
}

void ModelsJsonTests::testPatternsRoundTrip()
{
    palchron::Patterns patterns;
    patterns.avgAutosaveIntervalSeconds = 605.0;
    patterns.avgManualIntervalSeconds = 45.0;
    patterns.activityDistribution[palchron::ActivityLabel::Catching] = 4;
    patterns.eventTypeDistribution[palchron::EventType::BaseCreated] = 1;
    patterns.totalSaves = 7;

    const nlohmann::json j = patterns;
    QCOMPARE(j.at("activity_distribution").value("catching", 0), 4);
    QCOMPARE(j.at("event_type_distribution").value("base_created", 0), 1);

    const auto parsed = j.get<palchron::Patterns>();
    QCOMPARE(parsed.avgAutosaveIntervalSeconds, 605.0);
    QCOMPARE(parsed.avgManualIntervalSeconds, 45.0);
    QCOMPARE(parsed.activityDistribution.at(palchron::ActivityLabel::Catching), 4);
    QCOMPARE(parsed.eventTypeDistribution.at(palchron::EventType::BaseCreated), 1);
    QCOMPARE(parsed.totalSaves, 7);
}

void ModelsJsonTests::testLegacyNames()
{
    const nlohmann::json snapshotJson = {
        {"timestamp", "2024-02-01T10:00:00Z"},
        {"pals", nlohmann::json::array({{{"instance_id", "A1"}, {"species", "Lamball"}}})},
        {"pal_count", 1}
    };
    const auto snapshot = snapshotJson.get<palchron::Snapshot>();
    QCOMPARE(snapshot.creatures.size(), static_cast<size_t>(1));
    QCOMPARE(snapshot.creatureCount, 1);

    const nlohmann::json eventJson = {
        {"type", "pal_caught"}, {"category", "pal"}, {"message", "Caught"}, {"priority", 1}
    };
    const auto event = eventJson.get<palchron::EventSummary>();
    QCOMPARE(event.type, palchron::EventType::CreatureCaught);
    QCOMPARE(event.category, palchron::EventCategory::Creature);

    const nlohmann::json patternsJson = {{"avg_autosave_interval", 600.0}, {"total_saves", 2}};
    const auto patterns = patternsJson.get<palchron::Patterns>();
    QCOMPARE(patterns.avgAutosaveIntervalSeconds, 600.0);

    QCOMPARE(palchron::parseGenderString("EPalGenderType::Male"), palchron::Gender::Male);
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto creature = nlohmann::json::object().get<palchron::Creature>();
    QVERIFY(creature.instanceId.empty());
    QCOMPARE(creature.gender, palchron::Gender::Unknown);
    QVERIFY(!creature.nickname.has_value());

    const auto record = nlohmann::json{{"inferred_activity", "dancing"}}.get<palchron::SaveRecord>();
    QCOMPARE(record.inferredActivity, palchron::ActivityLabel::Unknown);
    QCOMPARE(record.saveType, palchron::SaveType::Unknown);
    QVERIFY(record.events.empty());
}

void ModelsJsonTests::testIso8601Parsing()
{
    const auto utc = palchron::parseIso8601("2024-02-01T10:00:00Z");
    QVERIFY(utc.has_value());
    QCOMPARE(QString::fromStdString(palchron::toIso8601Utc(*utc)),
             QStringLiteral("2024-02-01T10:00:00Z"));

    const auto offset = palchron::parseIso8601("2024-02-01T12:00:00+02:00");
    QVERIFY(offset.has_value());
    QVERIFY(*offset == *utc);

    const auto elapsed = palchron::secondsBetween("2024-02-01T10:00:00.250",
                                                  "2024-02-01T10:10:00.750");
    QVERIFY(elapsed.has_value());
    QCOMPARE(*elapsed, 600.5);

    QVERIFY(!palchron::parseIso8601("yesterday").has_value());
    QVERIFY(!palchron::secondsBetween("garbage", "2024-02-01T10:00:00Z").has_value());
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
