#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <memory>

#include "core/save_event_builder.hpp"
#include "common/json_utils.hpp"

class SaveEventBuilderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testFirstSave();
    void testAutosaveWithCatches();
    void testMissingFileAndBadTimestamp();
    void testSnapshotIsShared();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeSaveFile(const QString &name, int bytes) const;
};

void SaveEventBuilderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SaveEventBuilderTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString SaveEventBuilderTests::writeSaveFile(const QString &name, int bytes) const
{
    const QString path = m_tempDir.path() + QStringLiteral("/") + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(QByteArray(bytes, 'x'));
    }
    return path;
}

void SaveEventBuilderTests::testFirstSave()
{
    const QString path = writeSaveFile(QStringLiteral("first.sav"), 1000);

    palchron::Snapshot current;
    current.timestamp = "2024-02-01T10:00:00Z";

    const palchron::SaveEvent event =
        palchron::buildSaveEvent(current, nullptr, path.toStdString());

    QCOMPARE(QString::fromStdString(event.timestamp), QStringLiteral("2024-02-01T10:00:00Z"));
    QCOMPARE(event.fileSize, static_cast<int64_t>(1000));
    QCOMPARE(event.fileSizeDelta, static_cast<int64_t>(1000));
    QCOMPARE(event.timeSinceLast, 0.0);
    QCOMPARE(event.saveType, palchron::SaveType::Unknown);
    QVERIFY(event.events.empty());
    QCOMPARE(event.inferredActivity, palchron::ActivityLabel::Idle);
    QVERIFY(event.snapshot != nullptr);
}

void SaveEventBuilderTests::testAutosaveWithCatches()
{
    const QString path = writeSaveFile(QStringLiteral("world.sav"), 1500);

    palchron::Snapshot previous;
    previous.timestamp = "2024-02-01T10:00:00Z";

    palchron::Creature a;
    a.instanceId = "A";
    a.species = "Lamball";
    palchron::Creature b;
    b.instanceId = "B";
    b.species = "Cattiva";

    palchron::Snapshot current;
    current.timestamp = "2024-02-01T10:10:00Z";
    current.creatures = {a, b};
    current.creatureCount = 2;

    const palchron::SaveEvent event = palchron::buildSaveEvent(
        current, &previous, path.toStdString(), 1200, previous.timestamp);

    QCOMPARE(event.fileSize, static_cast<int64_t>(1500));
    QCOMPARE(event.fileSizeDelta, static_cast<int64_t>(300));
    QCOMPARE(event.timeSinceLast, 600.0);
    QCOMPARE(event.saveType, palchron::SaveType::Autosave);
    QCOMPARE(event.events.size(), static_cast<size_t>(2));
    QCOMPARE(event.events.front().type, palchron::EventType::CreatureCaught);
    QCOMPARE(event.inferredActivity, palchron::ActivityLabel::Catching);

    const palchron::SaveRecord record = palchron::toSaveRecord(event);
    QVERIFY(record.snapshotSummary.has_value());
    QCOMPARE(record.snapshotSummary->creatureCount, 2);
}

void SaveEventBuilderTests::testMissingFileAndBadTimestamp()
{
    palchron::Snapshot current;
    current.timestamp = "2024-02-01T10:00:00Z";

    const palchron::SaveEvent event = palchron::buildSaveEvent(
        current, nullptr, (m_tempDir.path() + QStringLiteral("/missing.sav")).toStdString(),
        500, std::string("not a timestamp"));

    QCOMPARE(event.fileSize, static_cast<int64_t>(0));
    QCOMPARE(event.fileSizeDelta, static_cast<int64_t>(-500));
    QCOMPARE(event.timeSinceLast, 0.0);
    QCOMPARE(event.saveType, palchron::SaveType::Unknown);
    QCOMPARE(palchron::fileSizeOrZero(m_tempDir.path().toStdString()), static_cast<int64_t>(0));
}

void SaveEventBuilderTests::testSnapshotIsShared()
{
    auto current = std::make_shared<const palchron::Snapshot>();
    const palchron::SaveEvent event = palchron::buildSaveEvent(current, nullptr, std::string());
    QCOMPARE(event.snapshot.get(), current.get());

    const palchron::SaveEvent empty = palchron::buildSaveEvent(
        std::shared_ptr<const palchron::Snapshot>(), nullptr, std::string());
    QVERIFY(empty.snapshot != nullptr);
    QCOMPARE(empty.inferredActivity, palchron::ActivityLabel::Idle);
}

QTEST_MAIN(SaveEventBuilderTests)
#include "test_save_event_builder.moc"
