#pragma once

#include <vector>

#include "common/models.hpp"

namespace palchron {

struct EventTypeCounts {
    int total = 0;
    int creaturesCaught = 0;
    int creaturesReleased = 0;
    int creaturesLeveled = 0;
    int playersLeveled = 0;
    int basesCreated = 0;
};

EventTypeCounts countEventTypes(const std::vector<EventSummary> &events);

struct ActivityRule {
    const char *name;
    ActivityLabel label;
    bool (*matches)(const EventTypeCounts &counts);
};

class ActivityClassifier
{
public:
    // Walks rules() in order and returns the label of the first match.
    // Only event type counts matter, never their order.
    static ActivityLabel infer(const std::vector<EventSummary> &events);
    static ActivityLabel infer(const EventTypeCounts &counts);

    // The ordered decision table. Rules are not mutually exclusive, so the
    // order is the tie-break policy. The last rule always matches.
    static const std::vector<ActivityRule> &rules();
    static const ActivityRule &matchingRule(const EventTypeCounts &counts);
};

} // namespace palchron
