#pragma once

#include <QString>
#include <QStringList>

#include "core/history_store.hpp"

namespace palchron {

class ReportCli
{
public:
    // CLI dispatcher for snapshots, diffs, recording saves and history reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runSnapshot(const QStringList &args);
    int runDiff(const QStringList &args);
    int runRecord(const QStringList &args);
    int runStats(const QStringList &args);
    int runSession(const QStringList &args);
    int runTrends(const QStringList &args);
    int runRecent(const QStringList &args);

    // History subcommands open the store from the environment unless --history is given.
    HistoryStore::Options historyOptions(const QStringList &args) const;
};

} // namespace palchron
