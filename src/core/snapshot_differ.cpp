#include "core/snapshot_differ.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <unordered_map>

#include "common/json_utils.hpp"

namespace palchron {

namespace {

// Keys in first-seen order; a repeated key keeps its first position but
// resolves to the last entry carrying it.
template <typename T>
struct KeyedIndex {
    std::vector<std::string> order;
    std::unordered_map<std::string, const T *> byKey;

    const T *find(const std::string &key) const
    {
        const auto it = byKey.find(key);
        return it == byKey.end() ? nullptr : it->second;
    }
};

template <typename T, typename KeyFn>
KeyedIndex<T> indexByKey(const std::vector<T> &items, KeyFn keyOf)
{
    KeyedIndex<T> index;
    for (const T &item : items) {
        const std::string &key = keyOf(item);
        if (key.empty()) {
            continue;
        }
        if (index.byKey.find(key) == index.byKey.end()) {
            index.order.push_back(key);
        }
        index.byKey[key] = &item;
    }
    return index;
}

const std::string &creatureKey(const Creature &creature)
{
    return creature.instanceId;
}

const std::string &playerKey(const Player &player)
{
    return player.uid;
}

Event makeEvent(EventType type, EventCategory category, nlohmann::json data,
                int priority, std::string message)
{
    Event event;
    event.type = type;
    event.category = category;
    event.data = std::move(data);
    event.priority = priority;
    event.message = std::move(message);
    return event;
}

std::string transition(int before, int after)
{
    return std::to_string(before) + " -> " + std::to_string(after);
}

} // namespace

std::vector<Event> diffSnapshots(const Snapshot &oldSnapshot, const Snapshot &newSnapshot)
{
    std::vector<Event> events;

    const auto oldCreatures = indexByKey(oldSnapshot.creatures, creatureKey);
    const auto newCreatures = indexByKey(newSnapshot.creatures, creatureKey);
    const auto oldPlayers = indexByKey(oldSnapshot.players, playerKey);
    const auto newPlayers = indexByKey(newSnapshot.players, playerKey);

    for (const std::string &id : newCreatures.order) {
        if (oldCreatures.find(id)) {
            continue;
        }
        const Creature &creature = *newCreatures.find(id);
        const int totalIv = creature.hpIv + creature.defIv + creature.atkIv;
        events.push_back(makeEvent(
            EventType::CreatureCaught, EventCategory::Creature, creature,
            totalIv >= kGoodRollThreshold ? 1 : 2,
            "Caught " + creature.species + " Lv." + std::to_string(creature.level)
                + " (IVs: " + std::to_string(creature.hpIv) + "/"
                + std::to_string(creature.defIv) + "/" + std::to_string(creature.atkIv)
                + " = " + std::to_string(totalIv) + ")"));
    }

    for (const std::string &id : oldCreatures.order) {
        if (newCreatures.find(id)) {
            continue;
        }
        const Creature &creature = *oldCreatures.find(id);
        events.push_back(makeEvent(
            EventType::CreatureReleased, EventCategory::Creature, creature, 2,
            "Released/Lost " + creature.species + " Lv." + std::to_string(creature.level)));
    }

    for (const std::string &id : newCreatures.order) {
        const Creature *before = oldCreatures.find(id);
        if (!before) {
            continue;
        }
        const Creature &after = *newCreatures.find(id);
        if (after.level <= before->level) {
            continue;
        }
        events.push_back(makeEvent(
            EventType::CreatureLeveled, EventCategory::Creature,
            nlohmann::json{{"old", *before}, {"new", after}}, 3,
            after.species + " leveled up: " + transition(before->level, after.level)));
    }

    for (const std::string &uid : newPlayers.order) {
        if (oldPlayers.find(uid)) {
            continue;
        }
        const Player &player = *newPlayers.find(uid);
        events.push_back(makeEvent(
            EventType::PlayerJoined, EventCategory::Player, player, 1,
            player.name + " joined the world (Lv." + std::to_string(player.level) + ")"));
    }

    for (const std::string &uid : oldPlayers.order) {
        if (newPlayers.find(uid)) {
            continue;
        }
        const Player &player = *oldPlayers.find(uid);
        events.push_back(makeEvent(
            EventType::PlayerLeft, EventCategory::Player, player, 1,
            player.name + " left the world"));
    }

    for (const std::string &uid : newPlayers.order) {
        const Player *before = oldPlayers.find(uid);
        if (!before) {
            continue;
        }
        const Player &after = *newPlayers.find(uid);
        if (after.level <= before->level) {
            continue;
        }
        events.push_back(makeEvent(
            EventType::PlayerLeveled, EventCategory::Player,
            nlohmann::json{{"old", *before}, {"new", after}}, 2,
            after.name + " leveled up: " + transition(before->level, after.level)));
    }

    if (newSnapshot.bases.size() > oldSnapshot.bases.size()) {
        const size_t total = newSnapshot.bases.size();
        events.push_back(makeEvent(
            EventType::BaseCreated, EventCategory::Base,
            nlohmann::json{{"count", total}}, 1,
            "New base established! Total bases: " + std::to_string(total)));
    }

    const int countDiff = newSnapshot.creatureCount - oldSnapshot.creatureCount;
    if (std::abs(countDiff) >= kCreatureChurnThreshold) {
        events.push_back(makeEvent(
            EventType::CreatureCountChange, EventCategory::World,
            nlohmann::json{{"old", oldSnapshot.creatureCount},
                           {"new", newSnapshot.creatureCount},
                           {"diff", countDiff}},
            3,
            "Creature count: " + transition(oldSnapshot.creatureCount, newSnapshot.creatureCount)
                + " (" + (countDiff > 0 ? "+" : "") + std::to_string(countDiff) + ")"));
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const Event &a, const Event &b) { return a.priority < b.priority; });
    return events;
}

EventSummary summarizeEvent(const Event &event)
{
    EventSummary summary;
    summary.type = event.type;
    summary.category = event.category;
    summary.message = event.message;
    summary.priority = event.priority;
    return summary;
}

std::vector<EventSummary> summarizeEvents(const std::vector<Event> &events)
{
    std::vector<EventSummary> summaries;
    summaries.reserve(events.size());
    for (const Event &event : events) {
        summaries.push_back(summarizeEvent(event));
    }
    return summaries;
}

} // namespace palchron
