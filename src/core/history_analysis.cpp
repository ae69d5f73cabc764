#include "core/history_analysis.hpp"

#include <algorithm>
#include <utility>

#include "common/json_utils.hpp"
#include "core/activity_classifier.hpp"

namespace palchron {

namespace {

// Frequency tally that remembers first-seen order, so ties resolve to
// whichever label was encountered first.
class ActivityTally
{
public:
    void add(ActivityLabel label)
    {
        for (auto &entry : m_counts) {
            if (entry.first == label) {
                ++entry.second;
                return;
            }
        }
        m_counts.emplace_back(label, 1);
    }

    std::pair<ActivityLabel, int> top() const
    {
        std::pair<ActivityLabel, int> best{ActivityLabel::Unknown, 0};
        for (const auto &entry : m_counts) {
            if (entry.second > best.second) {
                best = entry;
            }
        }
        return best;
    }

private:
    std::vector<std::pair<ActivityLabel, int>> m_counts;
};

std::vector<EventSummary> collectEvents(const std::vector<const SaveRecord *> &records)
{
    std::vector<EventSummary> events;
    for (const SaveRecord *record : records) {
        events.insert(events.end(), record->events.begin(), record->events.end());
    }
    return events;
}

std::vector<const SaveRecord *> pointersTo(const std::vector<SaveRecord> &log, size_t first)
{
    std::vector<const SaveRecord *> records;
    records.reserve(log.size() - first);
    for (size_t i = first; i < log.size(); ++i) {
        records.push_back(&log[i]);
    }
    return records;
}

} // namespace

Patterns computePatterns(const std::vector<SaveRecord> &log)
{
    Patterns patterns;

    double autosaveTotal = 0.0;
    int autosaveCount = 0;
    double manualTotal = 0.0;
    int manualCount = 0;

    for (const SaveRecord &record : log) {
        if (record.timeSinceLast > 0.0) {
            if (record.saveType == SaveType::Autosave) {
                autosaveTotal += record.timeSinceLast;
                ++autosaveCount;
            } else if (record.saveType == SaveType::Manual) {
                manualTotal += record.timeSinceLast;
                ++manualCount;
            }
        }

        ++patterns.activityDistribution[record.inferredActivity];
        for (const EventSummary &event : record.events) {
            ++patterns.eventTypeDistribution[event.type];
        }
    }

    patterns.avgAutosaveIntervalSeconds = autosaveCount > 0 ? autosaveTotal / autosaveCount : 0.0;
    patterns.avgManualIntervalSeconds = manualCount > 0 ? manualTotal / manualCount : 0.0;
    patterns.totalSaves = static_cast<int>(log.size());
    return patterns;
}

std::vector<SaveRecord> recentRecords(const std::vector<SaveRecord> &log, size_t count)
{
    const size_t first = log.size() > count ? log.size() - count : 0;
    return std::vector<SaveRecord>(log.begin() + static_cast<std::ptrdiff_t>(first), log.end());
}

std::optional<SessionSummary> summarizeSession(const std::vector<SaveRecord> &log)
{
    if (log.empty()) {
        return std::nullopt;
    }

    // Walk back from the newest save until the first gap longer than a session.
    // A timestamp that does not parse never splits a session.
    std::vector<const SaveRecord *> session;
    ActivityTally activities;
    for (auto it = log.rbegin(); it != log.rend(); ++it) {
        if (!session.empty()) {
            const auto gap = secondsBetween(it->timestamp, session.back()->timestamp);
            if (gap.has_value() && *gap > kSessionGapSeconds) {
                break;
            }
        }
        session.push_back(&*it);
        activities.add(it->inferredActivity);
    }
    std::reverse(session.begin(), session.end());

    SessionSummary summary;
    summary.startTime = session.front()->timestamp;
    summary.endTime = session.back()->timestamp;
    summary.durationMinutes = secondsBetween(summary.startTime, summary.endTime).value_or(0.0) / 60.0;
    summary.saveCount = static_cast<int>(session.size());

    const EventTypeCounts counts = countEventTypes(collectEvents(session));
    summary.creaturesCaught = counts.creaturesCaught;
    summary.creaturesReleased = counts.creaturesReleased;
    summary.levelUps = counts.creaturesLeveled + counts.playersLeveled;
    summary.basesBuilt = counts.basesCreated;
    summary.primaryActivity = activities.top().first;
    return summary;
}

std::optional<HistoryStats> computeStats(const std::vector<SaveRecord> &log,
                                         const Patterns &patterns)
{
    if (log.empty()) {
        return std::nullopt;
    }

    const EventTypeCounts counts = countEventTypes(collectEvents(pointersTo(log, 0)));

    HistoryStats stats;
    stats.totalSaves = static_cast<int>(log.size());
    stats.totalCreaturesCaught = counts.creaturesCaught;
    stats.totalCreaturesReleased = counts.creaturesReleased;
    stats.totalLevelUps = counts.creaturesLeveled + counts.playersLeveled;
    stats.totalBasesBuilt = counts.basesCreated;
    stats.patterns = patterns;
    return stats;
}

std::vector<std::string> detectTrends(const std::vector<SaveRecord> &log)
{
    if (log.size() < kMinRecordsForTrends) {
        return {kNotEnoughDataMessage};
    }

    const size_t first = log.size() > kTrendWindow ? log.size() - kTrendWindow : 0;
    const std::vector<const SaveRecord *> recent = pointersTo(log, first);

    std::vector<std::string> trends;

    ActivityTally activities;
    for (const SaveRecord *record : recent) {
        activities.add(record->inferredActivity);
    }
    const auto [topActivity, topCount] = activities.top();
    if (topCount >= kDominantActivityMin) {
        trends.push_back("You've been mostly " + toActivityString(topActivity) + " lately ("
                         + std::to_string(topCount) + "/" + std::to_string(recent.size())
                         + " saves)");
    }

    const EventTypeCounts counts = countEventTypes(collectEvents(recent));
    if (counts.creaturesCaught >= kCatchingSpreeMin) {
        trends.push_back("Catching spree! " + std::to_string(counts.creaturesCaught)
                         + " creatures caught recently");
    }
    if (counts.creaturesLeveled >= kTrainingSpreeMin) {
        trends.push_back("Training hard! " + std::to_string(counts.creaturesLeveled)
                         + " level ups recently");
    }

    std::vector<int64_t> sizes;
    for (const SaveRecord *record : recent) {
        if (record->fileSize > 0) {
            sizes.push_back(record->fileSize);
        }
    }
    if (sizes.size() >= kGrowthMinSamples
        && sizes.back() * kGrowthDenominator >= sizes.front() * kGrowthNumerator) {
        trends.push_back("Your world is growing (save file size increasing)");
    }

    if (trends.empty()) {
        trends.push_back(kSteadyPlayMessage);
    }
    return trends;
}

} // namespace palchron
