#include "core/activity_classifier.hpp"

namespace palchron {

EventTypeCounts countEventTypes(const std::vector<EventSummary> &events)
{
    EventTypeCounts counts;
    counts.total = static_cast<int>(events.size());
    for (const EventSummary &event : events) {
        switch (event.type) {
        case EventType::CreatureCaught:
            ++counts.creaturesCaught;
            break;
        case EventType::CreatureReleased:
            ++counts.creaturesReleased;
            break;
        case EventType::CreatureLeveled:
            ++counts.creaturesLeveled;
            break;
        case EventType::PlayerLeveled:
            ++counts.playersLeveled;
            break;
        case EventType::BaseCreated:
            ++counts.basesCreated;
            break;
        default:
            break;
        }
    }
    return counts;
}

const std::vector<ActivityRule> &ActivityClassifier::rules()
{
    static const std::vector<ActivityRule> kRules = {
        {"no_events", ActivityLabel::Idle,
         [](const EventTypeCounts &c) { return c.total == 0; }},
        {"multiple_catches", ActivityLabel::Catching,
         [](const EventTypeCounts &c) { return c.creaturesCaught >= 2; }},
        {"heavy_leveling", ActivityLabel::Combat,
         [](const EventTypeCounts &c) { return c.creaturesLeveled >= 3 || c.playersLeveled >= 1; }},
        {"base_created", ActivityLabel::Building,
         [](const EventTypeCounts &c) { return c.basesCreated >= 1; }},
        {"single_catch", ActivityLabel::Catching,
         [](const EventTypeCounts &c) { return c.creaturesCaught == 1 && c.creaturesReleased == 0; }},
        {"some_leveling", ActivityLabel::Combat,
         [](const EventTypeCounts &c) { return c.creaturesLeveled >= 1; }},
        {"releases_only", ActivityLabel::Managing,
         [](const EventTypeCounts &c) { return c.creaturesReleased >= 1 && c.creaturesCaught == 0; }},
        {"default", ActivityLabel::Exploring,
         [](const EventTypeCounts &) { return true; }},
    };
    return kRules;
}

const ActivityRule &ActivityClassifier::matchingRule(const EventTypeCounts &counts)
{
    const auto &table = rules();
    for (const ActivityRule &rule : table) {
        if (rule.matches(counts)) {
            return rule;
        }
    }
    return table.back();
}

ActivityLabel ActivityClassifier::infer(const EventTypeCounts &counts)
{
    return matchingRule(counts).label;
}

ActivityLabel ActivityClassifier::infer(const std::vector<EventSummary> &events)
{
    return infer(countEventTypes(events));
}

} // namespace palchron
