#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace palchron {

constexpr size_t kDefaultMaxEvents = 100;

// HistoryStore owns the bounded save log and its derived Patterns. The log is
// loaded from a JSON file on construction and written back after every
// append. Queries delegate to the pure functions in history_analysis.hpp.
class HistoryStore {
public:
    struct Options {
        std::string path;
        size_t maxEvents = kDefaultMaxEvents;

        // $HOME/.local/share/palchron/save_history.json unless
        // PALCHRON_HISTORY_PATH is set; PALCHRON_MAX_EVENTS overrides the size.
        static Options fromEnvironment();
    };

    HistoryStore();
    explicit HistoryStore(Options options);
    ~HistoryStore();

    HistoryStore(const HistoryStore &) = delete;
    HistoryStore &operator=(const HistoryStore &) = delete;

    // Push, recompute patterns over the full log, trim to maxEvents (oldest
    // first) and persist. Returns false if the file could not be written;
    // the in-memory state is updated either way.
    bool append(const SaveEvent &event);
    bool append(const SaveRecord &record);

    const std::vector<SaveRecord> &records() const;
    std::optional<SaveRecord> lastRecord() const;
    const Patterns &patterns() const;
    const std::string &lastUpdated() const;
    const std::string &path() const;
    size_t maxEvents() const;

    std::vector<SaveRecord> recentEvents(size_t count = 10) const;
    std::optional<SessionSummary> sessionSummary() const;
    std::optional<HistoryStats> stats() const;
    std::vector<std::string> detectTrends() const;

private:
    void load();
    bool save();

    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace palchron
