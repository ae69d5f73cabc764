#pragma once

#include <vector>

#include "common/models.hpp"

namespace palchron {

// Sum of the three individual values at or above which a catch is high priority.
constexpr int kGoodRollThreshold = 200;

// Creature count delta at or above which a count-change summary is emitted.
constexpr int kCreatureChurnThreshold = 5;

/**
 * Compare two snapshots and return the detected events, stably sorted by
 * ascending priority. Creatures are matched by instance_id and players by
 * uid; entries with an empty key never match anything. Bases have no stable
 * key and are compared by count only.
 *
 * Pure and deterministic: no I/O, no exceptions for expected input.
 */
std::vector<Event> diffSnapshots(const Snapshot &oldSnapshot, const Snapshot &newSnapshot);

// The persisted projection of an event.
EventSummary summarizeEvent(const Event &event);
std::vector<EventSummary> summarizeEvents(const std::vector<Event> &events);

} // namespace palchron
