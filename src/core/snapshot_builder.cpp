#include "core/snapshot_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace palchron {

namespace {

const nlohmann::json *child(const nlohmann::json *node, const char *key)
{
    if (!node || !node->is_object()) {
        return nullptr;
    }
    const auto it = node->find(key);
    if (it == node->end()) {
        return nullptr;
    }
    return &*it;
}

// Strip {"value": ...} wrappers until a bare value (or a wrapper-free object) remains.
const nlohmann::json *unwrap(const nlohmann::json *node)
{
    while (node && node->is_object()) {
        const auto it = node->find("value");
        if (it == node->end()) {
            break;
        }
        node = &*it;
    }
    return node;
}

std::string readString(const nlohmann::json *node, const std::string &fallback)
{
    node = unwrap(node);
    if (!node || node->is_null()) {
        return fallback;
    }
    if (node->is_string()) {
        return node->get<std::string>();
    }
    if (node->is_number() || node->is_boolean()) {
        return node->dump();
    }
    return fallback;
}

int64_t readInt(const nlohmann::json *node, int64_t fallback)
{
    node = unwrap(node);
    if (!node) {
        return fallback;
    }
    if (node->is_number_integer()) {
        return node->get<int64_t>();
    }
    if (node->is_number_float()) {
        return static_cast<int64_t>(node->get<double>());
    }
    return fallback;
}

bool readBool(const nlohmann::json *node, bool fallback)
{
    node = unwrap(node);
    if (!node || !node->is_boolean()) {
        return fallback;
    }
    return node->get<bool>();
}

std::vector<std::string> readStringList(const nlohmann::json *node)
{
    node = unwrap(node);
    if (node && node->is_object()) {
        node = child(node, "values");
    }
    std::vector<std::string> values;
    if (!node || !node->is_array()) {
        return values;
    }
    for (const auto &item : *node) {
        const std::string value = readString(&item, "");
        if (!value.empty()) {
            values.push_back(value);
        }
    }
    return values;
}

int clampIndividualValue(int64_t value)
{
    return static_cast<int>(std::clamp<int64_t>(value, 0, kMaxIndividualValue));
}

int clampLevel(int64_t value)
{
    return static_cast<int>(std::max<int64_t>(value, 0));
}

} // namespace

bool isHostUid(const std::string &uid)
{
    if (uid.empty()) {
        return false;
    }
    std::string cleaned;
    cleaned.reserve(uid.size());
    for (char ch : uid) {
        if (ch == '-') {
            continue;
        }
        cleaned.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return cleaned == "00000000000000000000000000000001";
}

std::optional<std::string> extractWorldId(const std::string &filePath)
{
    if (filePath.empty()) {
        return std::nullopt;
    }
    std::string normalized = filePath;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= normalized.size()) {
        const size_t end = normalized.find('/', start);
        if (end == std::string::npos) {
            parts.push_back(normalized.substr(start));
            break;
        }
        parts.push_back(normalized.substr(start, end - start));
        start = end + 1;
    }

    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i] == "Level.sav" && !parts[i - 1].empty()) {
            return parts[i - 1];
        }
    }
    return std::nullopt;
}

Snapshot buildSnapshot(const RawWorldState &raw,
                       std::chrono::system_clock::time_point timestamp)
{
    Snapshot snapshot;
    snapshot.timestamp = toIso8601Utc(timestamp);
    snapshot.filePath = raw.filePath;

    snapshot.players.reserve(raw.players.size());
    for (const RawPlayer &rawPlayer : raw.players) {
        Player player;
        player.uid = rawPlayer.uid;
        player.name = rawPlayer.name;
        player.level = std::max(rawPlayer.level, 0);
        player.isHost = isHostUid(rawPlayer.uid);
        snapshot.players.push_back(std::move(player));
    }

    snapshot.creatures.reserve(raw.creatures.size());
    for (Creature creature : raw.creatures) {
        creature.level = std::max(creature.level, 0);
        creature.exp = std::max<int64_t>(creature.exp, 0);
        creature.hpIv = clampIndividualValue(creature.hpIv);
        creature.defIv = clampIndividualValue(creature.defIv);
        creature.atkIv = clampIndividualValue(creature.atkIv);
        snapshot.creatures.push_back(std::move(creature));
    }
    snapshot.creatureCount = static_cast<int>(snapshot.creatures.size());

    for (int i = 0; i < raw.baseCount; ++i) {
        snapshot.bases.push_back(Base{std::to_string(i), "Base " + std::to_string(i + 1)});
    }

    snapshot.gameTime = raw.gameTime;
    snapshot.worldId = raw.worldId.has_value() ? raw.worldId : extractWorldId(raw.filePath);

    if (raw.hostPlayer.has_value()) {
        snapshot.hostPlayer = raw.hostPlayer;
    } else {
        for (const Player &player : snapshot.players) {
            if (player.isHost) {
                snapshot.hostPlayer = player.name;
                break;
            }
        }
    }

    if (raw.creatureCount != 0 && raw.creatureCount != snapshot.creatureCount) {
        PLOG_DEBUG(QStringLiteral("SnapshotBuilder"),
                   QStringLiteral("buildSnapshot"),
                   QStringLiteral("creature_count_mismatch"),
                   QStringLiteral("snapshot_construction"),
                   QStringLiteral("list_size_wins"),
                   palchron::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"reported", raw.creatureCount},
                                   {"listed", snapshot.creatureCount}}));
    }

    return snapshot;
}

Snapshot buildSnapshot(const RawWorldState &raw)
{
    return buildSnapshot(raw, std::chrono::system_clock::now());
}

std::optional<RawWorldState> worldStateFromPropertyTree(const nlohmann::json &tree,
                                                        const std::string &filePath)
{
    const nlohmann::json *world =
        child(child(child(&tree, "properties"), "worldSaveData"), "value");
    if (!world || !world->is_object()) {
        PLOG_WARN(QStringLiteral("SnapshotBuilder"),
                  QStringLiteral("worldStateFromPropertyTree"),
                  QStringLiteral("world_data_missing"),
                  QStringLiteral("snapshot_construction"),
                  QStringLiteral("property_tree"),
                  palchron::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", filePath}}));
        return std::nullopt;
    }

    RawWorldState raw;
    raw.filePath = filePath;

    const nlohmann::json *characters =
        child(child(world, "CharacterSaveParameterMap"), "value");
    if (characters && characters->is_array()) {
        for (const auto &entry : *characters) {
            const nlohmann::json *key = child(&entry, "key");
            const nlohmann::json *params = child(
                child(child(child(child(child(&entry, "value"), "RawData"), "value"),
                            "object"),
                      "SaveParameter"),
                "value");
            if (!params || !params->is_object() || params->empty()) {
                continue;
            }

            if (readBool(child(params, "IsPlayer"), false)) {
                RawPlayer player;
                player.uid = readString(child(key, "PlayerUId"), "");
                player.name = readString(child(params, "NickName"), "Unknown");
                player.level = clampLevel(readInt(child(params, "Level"), 0));
                raw.players.push_back(std::move(player));
                continue;
            }

            const std::string species = readString(child(params, "CharacterID"), "");
            if (species.empty() || species == "Unknown") {
                continue;
            }

            Creature creature;
            creature.instanceId = readString(child(key, "InstanceId"), "");
            creature.species = species;
            creature.level = clampLevel(readInt(child(params, "Level"), 0));
            creature.exp = std::max<int64_t>(readInt(child(params, "Exp"), 0), 0);
            creature.hpIv = clampIndividualValue(readInt(child(params, "Talent_HP"), 0));
            creature.defIv = clampIndividualValue(readInt(child(params, "Talent_Defense"), 0));
            creature.atkIv = clampIndividualValue(readInt(child(params, "Talent_Shot"), 0));
            creature.gender = parseGenderString(readString(child(params, "Gender"), ""));
            creature.passives = readStringList(child(params, "PassiveSkillList"));
            creature.ownerUid = readString(child(params, "OwnerPlayerUId"), "");
            const nlohmann::json *nickname = unwrap(child(params, "NickName"));
            if (nickname && nickname->is_string()) {
                creature.nickname = nickname->get<std::string>();
            }
            raw.creatures.push_back(std::move(creature));
        }
    }
    raw.creatureCount = static_cast<int>(raw.creatures.size());

    const nlohmann::json *baseCamps = child(child(world, "BaseCampSaveData"), "value");
    if (baseCamps && baseCamps->is_array()) {
        raw.baseCount = static_cast<int>(baseCamps->size());
    }

    const nlohmann::json *ticks = unwrap(child(
        child(child(world, "GameTimeSaveData"), "value"), "GameDateTimeTicks"));
    if (ticks && ticks->is_number_integer()) {
        raw.gameTime = ticks->get<int64_t>();
    }

    raw.worldId = extractWorldId(filePath);

    PLOG_DEBUG(QStringLiteral("SnapshotBuilder"),
               QStringLiteral("worldStateFromPropertyTree"),
               QStringLiteral("world_state_extracted"),
               QStringLiteral("snapshot_construction"),
               QStringLiteral("property_tree"),
               palchron::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", filePath},
                               {"players", raw.players.size()},
                               {"creatures", raw.creatures.size()},
                               {"bases", raw.baseCount}}));
    return raw;
}

} // namespace palchron
