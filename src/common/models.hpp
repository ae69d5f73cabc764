#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace palchron {

constexpr int kMaxIndividualValue = 100;

struct Player {
    std::string uid;
    std::string name;
    int level = 0;
    bool isHost = false;
};

struct Creature {
    std::string instanceId;
    std::string species;
    int level = 0;
    int64_t exp = 0;
    int hpIv = 0;
    int defIv = 0;
    int atkIv = 0;
    Gender gender = Gender::Unknown;
    std::vector<std::string> passives;
    std::string ownerUid;
    std::optional<std::string> nickname;
};

struct Base {
    std::string id;
    std::string name;
};

// What the external save converter hands us, already strongly typed.
struct RawPlayer {
    std::string uid;
    std::string name;
    int level = 0;
};

struct RawWorldState {
    std::string filePath;
    std::vector<RawPlayer> players;
    std::vector<Creature> creatures;
    int baseCount = 0;
    int creatureCount = 0;
    std::optional<int64_t> gameTime;
    std::optional<std::string> worldId;
    std::optional<std::string> hostPlayer;
};

struct Snapshot {
    std::string timestamp;
    std::string filePath;
    std::vector<Player> players;
    std::vector<Creature> creatures;
    std::vector<Base> bases;
    int creatureCount = 0;
    std::optional<int64_t> gameTime;
    std::optional<std::string> worldId;
    std::optional<std::string> hostPlayer;
};

struct Event {
    EventType type = EventType::Unknown;
    EventCategory category = EventCategory::World;
    nlohmann::json data;
    int priority = 3;
    std::string message;
};

// Lightweight projection of an Event; the payload is dropped.
struct EventSummary {
    EventType type = EventType::Unknown;
    EventCategory category = EventCategory::World;
    std::string message;
    int priority = 3;
};

struct SnapshotSummary {
    int creatureCount = 0;
    int playerCount = 0;
    int baseCount = 0;
};

// In-memory record of one observed save. Holds the full snapshot for
// immediate use; convert to SaveRecord before persisting.
struct SaveEvent {
    std::string timestamp;
    std::string filePath;
    int64_t fileSize = 0;
    int64_t fileSizeDelta = 0;
    double timeSinceLast = 0.0;
    SaveType saveType = SaveType::Unknown;
    std::vector<EventSummary> events;
    ActivityLabel inferredActivity = ActivityLabel::Idle;
    std::shared_ptr<const Snapshot> snapshot;
};

// Persisted form of a SaveEvent.
struct SaveRecord {
    std::string timestamp;
    std::string filePath;
    int64_t fileSize = 0;
    int64_t fileSizeDelta = 0;
    double timeSinceLast = 0.0;
    SaveType saveType = SaveType::Unknown;
    std::vector<EventSummary> events;
    ActivityLabel inferredActivity = ActivityLabel::Idle;
    std::optional<SnapshotSummary> snapshotSummary;
};

struct Patterns {
    double avgAutosaveIntervalSeconds = 0.0;
    double avgManualIntervalSeconds = 0.0;
    std::map<ActivityLabel, int> activityDistribution;
    std::map<EventType, int> eventTypeDistribution;
    int totalSaves = 0;
};

struct SessionSummary {
    std::string startTime;
    std::string endTime;
    double durationMinutes = 0.0;
    int saveCount = 0;
    int creaturesCaught = 0;
    int creaturesReleased = 0;
    int levelUps = 0;
    int basesBuilt = 0;
    ActivityLabel primaryActivity = ActivityLabel::Unknown;
};

struct HistoryStats {
    int totalSaves = 0;
    int totalCreaturesCaught = 0;
    int totalCreaturesReleased = 0;
    int totalLevelUps = 0;
    int totalBasesBuilt = 0;
    Patterns patterns;
};

inline SnapshotSummary summarizeSnapshot(const Snapshot &snapshot)
{
    SnapshotSummary summary;
    summary.creatureCount = snapshot.creatureCount;
    summary.playerCount = static_cast<int>(snapshot.players.size());
    summary.baseCount = static_cast<int>(snapshot.bases.size());
    return summary;
}

inline SaveRecord toSaveRecord(const SaveEvent &event)
{
    SaveRecord record;
    record.timestamp = event.timestamp;
    record.filePath = event.filePath;
    record.fileSize = event.fileSize;
    record.fileSizeDelta = event.fileSizeDelta;
    record.timeSinceLast = event.timeSinceLast;
    record.saveType = event.saveType;
    record.events = event.events;
    record.inferredActivity = event.inferredActivity;
    if (event.snapshot) {
        record.snapshotSummary = summarizeSnapshot(*event.snapshot);
    }
    return record;
}

} // namespace palchron
