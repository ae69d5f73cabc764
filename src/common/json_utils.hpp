#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace palchron {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM" suffix. A missing zone is read as UTC.
inline std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(in, rest);

    size_t pos = 0;
    std::chrono::microseconds fraction{0};
    if (pos < rest.size() && (rest[pos] == '.' || rest[pos] == ',')) {
        ++pos;
        int digits = 0;
        int64_t micros = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (rest[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
        fraction = std::chrono::microseconds{micros};
    }

    int offsetSeconds = 0;
    if (pos < rest.size()) {
        const char marker = rest[pos];
        if (marker == 'Z' || marker == 'z') {
            ++pos;
        } else if (marker == '+' || marker == '-') {
            ++pos;
            auto twoDigits = [&rest, &pos](int &out) {
                if (pos + 2 > rest.size()
                    || !std::isdigit(static_cast<unsigned char>(rest[pos]))
                    || !std::isdigit(static_cast<unsigned char>(rest[pos + 1]))) {
                    return false;
                }
                out = (rest[pos] - '0') * 10 + (rest[pos + 1] - '0');
                pos += 2;
                return true;
            };
            int hours = 0;
            int minutes = 0;
            if (!twoDigits(hours)) {
                return std::nullopt;
            }
            if (pos < rest.size() && rest[pos] == ':') {
                ++pos;
            }
            if (pos < rest.size() && !twoDigits(minutes)) {
                return std::nullopt;
            }
            offsetSeconds = (hours * 3600 + minutes * 60) * (marker == '+' ? 1 : -1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != rest.size()) {
        return std::nullopt;
    }

#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time - offsetSeconds)
        + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

// Seconds from `from` to `to`, or nullopt if either side does not parse.
inline std::optional<double> secondsBetween(const std::string &from, const std::string &to)
{
    const auto start = parseIso8601(from);
    const auto end = parseIso8601(to);
    if (!start.has_value() || !end.has_value()) {
        return std::nullopt;
    }
    return std::chrono::duration<double>(*end - *start).count();
}

inline std::string toGenderString(Gender gender)
{
    switch (gender) {
    case Gender::Male:
        return "male";
    case Gender::Female:
        return "female";
    case Gender::Unknown:
        return "unknown";
    }
    return "unknown";
}

// Understands both our own names and the engine's "EPalGenderType::Female".
inline Gender parseGenderString(const std::string &value)
{
    std::string lowered;
    const auto sep = value.rfind("::");
    const std::string tail = sep == std::string::npos ? value : value.substr(sep + 2);
    for (char ch : tail) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowered == "male") {
        return Gender::Male;
    }
    if (lowered == "female") {
        return Gender::Female;
    }
    return Gender::Unknown;
}

inline std::string toEventTypeString(EventType type)
{
    switch (type) {
    case EventType::CreatureCaught:
        return "creature_caught";
    case EventType::CreatureReleased:
        return "creature_released";
    case EventType::CreatureLeveled:
        return "creature_leveled";
    case EventType::PlayerJoined:
        return "player_joined";
    case EventType::PlayerLeft:
        return "player_left";
    case EventType::PlayerLeveled:
        return "player_leveled";
    case EventType::BaseCreated:
        return "base_created";
    case EventType::CreatureCountChange:
        return "creature_count_change";
    case EventType::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline EventType parseEventTypeString(const std::string &value)
{
    if (value == "creature_caught" || value == "pal_caught") {
        return EventType::CreatureCaught;
    }
    if (value == "creature_released" || value == "pal_released") {
        return EventType::CreatureReleased;
    }
    if (value == "creature_leveled" || value == "pal_leveled") {
        return EventType::CreatureLeveled;
    }
    if (value == "player_joined") {
        return EventType::PlayerJoined;
    }
    if (value == "player_left") {
        return EventType::PlayerLeft;
    }
    if (value == "player_leveled") {
        return EventType::PlayerLeveled;
    }
    if (value == "base_created") {
        return EventType::BaseCreated;
    }
    if (value == "creature_count_change" || value == "pal_count_change") {
        return EventType::CreatureCountChange;
    }
    return EventType::Unknown;
}

inline std::string toCategoryString(EventCategory category)
{
    switch (category) {
    case EventCategory::Creature:
        return "creature";
    case EventCategory::Player:
        return "player";
    case EventCategory::Base:
        return "base";
    case EventCategory::World:
        return "world";
    }
    return "world";
}

inline EventCategory parseCategoryString(const std::string &value)
{
    if (value == "creature" || value == "pal") {
        return EventCategory::Creature;
    }
    if (value == "player") {
        return EventCategory::Player;
    }
    if (value == "base") {
        return EventCategory::Base;
    }
    return EventCategory::World;
}

inline std::string toSaveTypeString(SaveType type)
{
    switch (type) {
    case SaveType::Autosave:
        return "autosave";
    case SaveType::Manual:
        return "manual";
    case SaveType::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline SaveType parseSaveTypeString(const std::string &value)
{
    if (value == "autosave") {
        return SaveType::Autosave;
    }
    if (value == "manual") {
        return SaveType::Manual;
    }
    return SaveType::Unknown;
}

inline std::string toActivityString(ActivityLabel label)
{
    switch (label) {
    case ActivityLabel::Idle:
        return "idle";
    case ActivityLabel::Catching:
        return "catching";
    case ActivityLabel::Combat:
        return "combat";
    case ActivityLabel::Building:
        return "building";
    case ActivityLabel::Managing:
        return "managing";
    case ActivityLabel::Exploring:
        return "exploring";
    case ActivityLabel::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline ActivityLabel parseActivityString(const std::string &value)
{
    if (value == "idle") {
        return ActivityLabel::Idle;
    }
    if (value == "catching") {
        return ActivityLabel::Catching;
    }
    if (value == "combat") {
        return ActivityLabel::Combat;
    }
    if (value == "building") {
        return ActivityLabel::Building;
    }
    if (value == "managing") {
        return ActivityLabel::Managing;
    }
    if (value == "exploring") {
        return ActivityLabel::Exploring;
    }
    return ActivityLabel::Unknown;
}

inline void to_json(nlohmann::json &j, const Gender &gender)
{
    j = toGenderString(gender);
}

inline void from_json(const nlohmann::json &j, Gender &gender)
{
    gender = j.is_string() ? parseGenderString(j.get<std::string>()) : Gender::Unknown;
}

inline void to_json(nlohmann::json &j, const EventType &type)
{
    j = toEventTypeString(type);
}

inline void from_json(const nlohmann::json &j, EventType &type)
{
    type = j.is_string() ? parseEventTypeString(j.get<std::string>()) : EventType::Unknown;
}

inline void to_json(nlohmann::json &j, const EventCategory &category)
{
    j = toCategoryString(category);
}

inline void from_json(const nlohmann::json &j, EventCategory &category)
{
    category = j.is_string() ? parseCategoryString(j.get<std::string>())
                             : EventCategory::World;
}

inline void to_json(nlohmann::json &j, const SaveType &type)
{
    j = toSaveTypeString(type);
}

inline void from_json(const nlohmann::json &j, SaveType &type)
{
    type = j.is_string() ? parseSaveTypeString(j.get<std::string>()) : SaveType::Unknown;
}

inline void to_json(nlohmann::json &j, const ActivityLabel &label)
{
    j = toActivityString(label);
}

inline void from_json(const nlohmann::json &j, ActivityLabel &label)
{
    label = j.is_string() ? parseActivityString(j.get<std::string>())
                          : ActivityLabel::Unknown;
}

inline nlohmann::json optionalToJson(const std::optional<std::string> &value)
{
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline std::optional<std::string> optionalStringFromJson(const nlohmann::json &j,
                                                         const char *key)
{
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const Player &player)
{
    j = nlohmann::json{
        {"uid", player.uid},
        {"name", player.name},
        {"level", player.level},
        {"is_host", player.isHost}
    };
}

inline void from_json(const nlohmann::json &j, Player &player)
{
    player.uid = j.value("uid", "");
    player.name = j.value("name", "");
    player.level = j.value("level", 0);
    player.isHost = j.value("is_host", false);
}

inline void to_json(nlohmann::json &j, const Creature &creature)
{
    j = nlohmann::json{
        {"instance_id", creature.instanceId},
        {"species", creature.species},
        {"level", creature.level},
        {"exp", creature.exp},
        {"hp_iv", creature.hpIv},
        {"def_iv", creature.defIv},
        {"atk_iv", creature.atkIv},
        {"gender", creature.gender},
        {"passives", creature.passives},
        {"owner_uid", creature.ownerUid},
        {"nickname", optionalToJson(creature.nickname)}
    };
}

inline void from_json(const nlohmann::json &j, Creature &creature)
{
    creature.instanceId = j.value("instance_id", "");
    creature.species = j.value("species", "");
    creature.level = j.value("level", 0);
    creature.exp = j.value("exp", static_cast<int64_t>(0));
    creature.hpIv = j.value("hp_iv", 0);
    creature.defIv = j.value("def_iv", 0);
    creature.atkIv = j.value("atk_iv", 0);
    if (j.contains("gender")) {
        creature.gender = j.at("gender").get<Gender>();
    } else {
        creature.gender = Gender::Unknown;
    }
    creature.passives.clear();
    if (j.contains("passives") && j.at("passives").is_array()) {
        for (const auto &passive : j.at("passives")) {
            if (passive.is_string()) {
                creature.passives.push_back(passive.get<std::string>());
            }
        }
    }
    creature.ownerUid = j.value("owner_uid", "");
    creature.nickname = optionalStringFromJson(j, "nickname");
}

inline void to_json(nlohmann::json &j, const Base &base)
{
    j = nlohmann::json{{"id", base.id}, {"name", base.name}};
}

inline void from_json(const nlohmann::json &j, Base &base)
{
    base.id = j.value("id", "");
    base.name = j.value("name", "");
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"timestamp", snapshot.timestamp},
        {"file_path", snapshot.filePath},
        {"players", snapshot.players},
        {"creatures", snapshot.creatures},
        {"bases", snapshot.bases},
        {"creature_count", snapshot.creatureCount},
        {"game_time", snapshot.gameTime.has_value() ? nlohmann::json(*snapshot.gameTime)
                                                    : nlohmann::json(nullptr)},
        {"world_id", optionalToJson(snapshot.worldId)},
        {"host_player", optionalToJson(snapshot.hostPlayer)}
    };
}

inline void from_json(const nlohmann::json &j, Snapshot &snapshot)
{
    snapshot.timestamp = j.value("timestamp", "");
    snapshot.filePath = j.value("file_path", "");
    if (j.contains("players") && j.at("players").is_array()) {
        snapshot.players = j.at("players").get<std::vector<Player>>();
    } else {
        snapshot.players.clear();
    }
    // "pals" and "pal_count" are the names used by older history files.
    const char *creaturesKey = j.contains("creatures") ? "creatures" : "pals";
    if (j.contains(creaturesKey) && j.at(creaturesKey).is_array()) {
        snapshot.creatures = j.at(creaturesKey).get<std::vector<Creature>>();
    } else {
        snapshot.creatures.clear();
    }
    if (j.contains("bases") && j.at("bases").is_array()) {
        snapshot.bases = j.at("bases").get<std::vector<Base>>();
    } else {
        snapshot.bases.clear();
    }
    const int defaultCount = static_cast<int>(snapshot.creatures.size());
    snapshot.creatureCount = j.value("creature_count", j.value("pal_count", defaultCount));
    if (j.contains("game_time") && j.at("game_time").is_number_integer()) {
        snapshot.gameTime = j.at("game_time").get<int64_t>();
    } else {
        snapshot.gameTime.reset();
    }
    snapshot.worldId = optionalStringFromJson(j, "world_id");
    snapshot.hostPlayer = optionalStringFromJson(j, "host_player");
}

inline void to_json(nlohmann::json &j, const Event &event)
{
    j = nlohmann::json{
        {"type", event.type},
        {"category", event.category},
        {"data", event.data},
        {"priority", event.priority},
        {"message", event.message}
    };
}

inline void from_json(const nlohmann::json &j, Event &event)
{
    event.type = j.contains("type") ? j.at("type").get<EventType>() : EventType::Unknown;
    event.category = j.contains("category") ? j.at("category").get<EventCategory>()
                                            : EventCategory::World;
    event.data = j.contains("data") ? j.at("data") : nlohmann::json::object();
    event.priority = j.value("priority", 3);
    event.message = j.value("message", "");
}

inline void to_json(nlohmann::json &j, const EventSummary &summary)
{
    j = nlohmann::json{
        {"type", summary.type},
        {"category", summary.category},
        {"message", summary.message},
        {"priority", summary.priority}
    };
}

inline void from_json(const nlohmann::json &j, EventSummary &summary)
{
    summary.type = j.contains("type") ? j.at("type").get<EventType>() : EventType::Unknown;
    summary.category = j.contains("category") ? j.at("category").get<EventCategory>()
                                              : EventCategory::World;
    summary.message = j.value("message", "");
    summary.priority = j.value("priority", 3);
}

inline void to_json(nlohmann::json &j, const SnapshotSummary &summary)
{
    j = nlohmann::json{
        {"creature_count", summary.creatureCount},
        {"player_count", summary.playerCount},
        {"base_count", summary.baseCount}
    };
}

inline void from_json(const nlohmann::json &j, SnapshotSummary &summary)
{
    summary.creatureCount = j.value("creature_count", j.value("pal_count", 0));
    summary.playerCount = j.value("player_count", 0);
    summary.baseCount = j.value("base_count", 0);
}

inline void to_json(nlohmann::json &j, const SaveRecord &record)
{
    j = nlohmann::json{
        {"timestamp", record.timestamp},
        {"file_path", record.filePath},
        {"file_size", record.fileSize},
        {"file_size_delta", record.fileSizeDelta},
        {"time_since_last", record.timeSinceLast},
        {"save_type", record.saveType},
        {"events", record.events},
        {"inferred_activity", record.inferredActivity}
    };
    if (record.snapshotSummary.has_value()) {
        j["snapshot_summary"] = *record.snapshotSummary;
    }
}

inline void from_json(const nlohmann::json &j, SaveRecord &record)
{
    record.timestamp = j.value("timestamp", "");
    record.filePath = j.value("file_path", "");
    record.fileSize = j.value("file_size", static_cast<int64_t>(0));
    record.fileSizeDelta = j.value("file_size_delta", static_cast<int64_t>(0));
    record.timeSinceLast = j.value("time_since_last", 0.0);
    record.saveType = j.contains("save_type") ? j.at("save_type").get<SaveType>()
                                              : SaveType::Unknown;
    if (j.contains("events") && j.at("events").is_array()) {
        record.events = j.at("events").get<std::vector<EventSummary>>();
    } else {
        record.events.clear();
    }
    record.inferredActivity = j.contains("inferred_activity")
        ? j.at("inferred_activity").get<ActivityLabel>()
        : ActivityLabel::Unknown;
    if (j.contains("snapshot_summary") && j.at("snapshot_summary").is_object()) {
        record.snapshotSummary = j.at("snapshot_summary").get<SnapshotSummary>();
    } else {
        record.snapshotSummary.reset();
    }
}

// A SaveEvent is always written in its persisted form.
inline void to_json(nlohmann::json &j, const SaveEvent &event)
{
    j = toSaveRecord(event);
}

inline void to_json(nlohmann::json &j, const Patterns &patterns)
{
    nlohmann::json activities = nlohmann::json::object();
    for (const auto &[label, count] : patterns.activityDistribution) {
        activities[toActivityString(label)] = count;
    }
    nlohmann::json eventTypes = nlohmann::json::object();
    for (const auto &[type, count] : patterns.eventTypeDistribution) {
        eventTypes[toEventTypeString(type)] = count;
    }
    j = nlohmann::json{
        {"avg_autosave_interval_seconds", patterns.avgAutosaveIntervalSeconds},
        {"avg_manual_interval_seconds", patterns.avgManualIntervalSeconds},
        {"activity_distribution", activities},
        {"event_type_distribution", eventTypes},
        {"total_saves", patterns.totalSaves}
    };
}

inline void from_json(const nlohmann::json &j, Patterns &patterns)
{
    patterns.avgAutosaveIntervalSeconds = j.value(
        "avg_autosave_interval_seconds", j.value("avg_autosave_interval", 0.0));
    patterns.avgManualIntervalSeconds = j.value(
        "avg_manual_interval_seconds", j.value("avg_manual_interval", 0.0));
    patterns.activityDistribution.clear();
    if (j.contains("activity_distribution") && j.at("activity_distribution").is_object()) {
        for (const auto &item : j.at("activity_distribution").items()) {
            if (item.value().is_number_integer()) {
                patterns.activityDistribution[parseActivityString(item.key())]
                    += item.value().get<int>();
            }
        }
    }
    patterns.eventTypeDistribution.clear();
    if (j.contains("event_type_distribution") && j.at("event_type_distribution").is_object()) {
        for (const auto &item : j.at("event_type_distribution").items()) {
            if (item.value().is_number_integer()) {
                patterns.eventTypeDistribution[parseEventTypeString(item.key())]
                    += item.value().get<int>();
            }
        }
    }
    patterns.totalSaves = j.value("total_saves", 0);
}

inline void to_json(nlohmann::json &j, const SessionSummary &summary)
{
    j = nlohmann::json{
        {"start_time", summary.startTime},
        {"end_time", summary.endTime},
        {"duration_minutes", summary.durationMinutes},
        {"save_count", summary.saveCount},
        {"creatures_caught", summary.creaturesCaught},
        {"creatures_released", summary.creaturesReleased},
        {"level_ups", summary.levelUps},
        {"bases_built", summary.basesBuilt},
        {"primary_activity", summary.primaryActivity}
    };
}

inline void to_json(nlohmann::json &j, const HistoryStats &stats)
{
    j = nlohmann::json{
        {"total_saves", stats.totalSaves},
        {"total_creatures_caught", stats.totalCreaturesCaught},
        {"total_creatures_released", stats.totalCreaturesReleased},
        {"total_level_ups", stats.totalLevelUps},
        {"total_bases_built", stats.totalBasesBuilt},
        {"patterns", stats.patterns}
    };
}

} // namespace palchron
