#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace palchron {

/**
 * Wrap an externally extracted world state into a Snapshot.
 *
 * - players get is_host from their uid
 * - bases are numbered by position ("0", "1", ...) since the save carries no
 *   stable base key
 * - individual values are clamped to [0, kMaxIndividualValue]
 * - creature_count always equals the number of creatures kept
 * - world_id and host_player are derived when the raw state omits them
 *
 * This function does not persist anything.
 */
Snapshot buildSnapshot(const RawWorldState &raw,
                       std::chrono::system_clock::time_point timestamp);
Snapshot buildSnapshot(const RawWorldState &raw);

/**
 * Convert the nested property tree produced by the external save converter
 * into a RawWorldState. Every property value may be wrapped in any number of
 * {"value": ...} objects.
 *
 * Returns std::nullopt if properties.worldSaveData is missing.
 */
std::optional<RawWorldState> worldStateFromPropertyTree(const nlohmann::json &tree,
                                                        const std::string &filePath);

// The world host always carries uid 00000000-0000-0000-0000-000000000001.
bool isHostUid(const std::string &uid);

// SaveGames/<SteamID>/<WorldID>/Level.sav -> <WorldID>
std::optional<std::string> extractWorldId(const std::string &filePath);

} // namespace palchron
