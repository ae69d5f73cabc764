#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace palchron {

// Saves further apart than this belong to different sessions.
constexpr double kSessionGapSeconds = 1800.0;

// Trend detection needs this many records and looks at most at the last kTrendWindow.
constexpr size_t kMinRecordsForTrends = 5;
constexpr size_t kTrendWindow = 10;
constexpr int kDominantActivityMin = 5;
constexpr int kCatchingSpreeMin = 3;
constexpr int kTrainingSpreeMin = 5;
constexpr size_t kGrowthMinSamples = 3;
// Growth is reported when the newest size is at least 11/10 of the oldest.
constexpr int64_t kGrowthNumerator = 11;
constexpr int64_t kGrowthDenominator = 10;

inline constexpr const char kNotEnoughDataMessage[] = "Not enough data yet to detect trends";
inline constexpr const char kSteadyPlayMessage[] = "Playing steadily, no strong trends detected";

// Rebuilds the aggregate from scratch over the whole log.
Patterns computePatterns(const std::vector<SaveRecord> &log);

// The last `count` records, oldest first.
std::vector<SaveRecord> recentRecords(const std::vector<SaveRecord> &log, size_t count);

// The newest run of records with no gap over kSessionGapSeconds.
// std::nullopt when the log is empty.
std::optional<SessionSummary> summarizeSession(const std::vector<SaveRecord> &log);

// Totals over the entire log. std::nullopt ("no history") when the log is empty.
std::optional<HistoryStats> computeStats(const std::vector<SaveRecord> &log,
                                         const Patterns &patterns);

std::vector<std::string> detectTrends(const std::vector<SaveRecord> &log);

} // namespace palchron
