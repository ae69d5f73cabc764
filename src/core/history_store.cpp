#include "core/history_store.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/history_analysis.hpp"

namespace palchron {

namespace {

std::string defaultHistoryPath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/palchron";
    return (basePath / "save_history.json").string();
}

size_t parseMaxEvents(const char *value)
{
    if (!value || *value == '\0') {
        return kDefaultMaxEvents;
    }
    char *end = nullptr;
    const long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0' || parsed <= 0) {
        return kDefaultMaxEvents;
    }
    return static_cast<size_t>(parsed);
}

} // namespace

struct HistoryStore::Impl {
    Options options;
    std::vector<SaveRecord> records;
    Patterns patterns;
    std::string lastUpdated;
};

HistoryStore::Options HistoryStore::Options::fromEnvironment()
{
    Options options;
    const char *overridePath = std::getenv("PALCHRON_HISTORY_PATH");
    options.path = (overridePath && *overridePath) ? overridePath : defaultHistoryPath();
    options.maxEvents = parseMaxEvents(std::getenv("PALCHRON_MAX_EVENTS"));
    return options;
}

HistoryStore::HistoryStore()
    : HistoryStore(Options::fromEnvironment())
{
}

HistoryStore::HistoryStore(Options options)
    : impl(std::make_unique<Impl>())
{
    if (options.path.empty()) {
        options.path = defaultHistoryPath();
    }
    if (options.maxEvents == 0) {
        options.maxEvents = 1;
    }
    impl->options = std::move(options);
    load();
}

HistoryStore::~HistoryStore() = default;

void HistoryStore::load()
{
    const QString path = QString::fromStdString(impl->options.path);
    QFile file(path);
    if (!file.exists()) {
        PLOG_WARN(QStringLiteral("HistoryStore"),
                  QStringLiteral("load"),
                  QStringLiteral("history_missing"),
                  QStringLiteral("store_open"),
                  QStringLiteral("start_empty"),
                  palchron::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", impl->options.path}}));
        return;
    }

    auto resetWithWarning = [this](const std::string &reason) {
        impl->records.clear();
        impl->patterns = Patterns{};
        impl->lastUpdated.clear();
        PLOG_WARN(QStringLiteral("HistoryStore"),
                  QStringLiteral("load"),
                  QStringLiteral("history_unreadable"),
                  QStringLiteral("store_open"),
                  QStringLiteral("start_empty"),
                  palchron::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", impl->options.path}, {"reason", reason}}));
    };

    if (!file.open(QIODevice::ReadOnly)) {
        resetWithWarning("open_failed");
        return;
    }
    const QByteArray data = file.readAll();

    try {
        const nlohmann::json root = nlohmann::json::parse(data.toStdString());
        if (!root.is_object()) {
            resetWithWarning("not_an_object");
            return;
        }
        if (root.contains("events") && root.at("events").is_array()) {
            impl->records = root.at("events").get<std::vector<SaveRecord>>();
        }
        if (root.contains("patterns") && root.at("patterns").is_object()
            && !root.at("patterns").empty()) {
            impl->patterns = root.at("patterns").get<Patterns>();
        } else {
            impl->patterns = computePatterns(impl->records);
        }
        impl->lastUpdated = root.value("last_updated", "");
    } catch (const nlohmann::json::exception &ex) {
        resetWithWarning(ex.what());
        return;
    }

    if (impl->records.size() > impl->options.maxEvents) {
        impl->records.erase(impl->records.begin(),
                            impl->records.end() - static_cast<std::ptrdiff_t>(impl->options.maxEvents));
    }

    PLOG_DEBUG(QStringLiteral("HistoryStore"),
               QStringLiteral("load"),
               QStringLiteral("history_loaded"),
               QStringLiteral("store_open"),
               QStringLiteral("json_file"),
               palchron::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", impl->options.path},
                               {"records", impl->records.size()}}));
}

bool HistoryStore::save()
{
    impl->lastUpdated = toIso8601Utc(std::chrono::system_clock::now());

    const nlohmann::json root{
        {"events", impl->records},
        {"patterns", impl->patterns},
        {"last_updated", impl->lastUpdated}
    };

    const QString path = QString::fromStdString(impl->options.path);
    QDir().mkpath(QFileInfo(path).absolutePath());

    // QSaveFile replaces the history only once the whole document is written.
    QSaveFile file(path);
    bool written = false;
    if (file.open(QIODevice::WriteOnly)) {
        const QByteArray data = QByteArray::fromStdString(
            root.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
        if (file.write(data) == data.size()) {
            written = file.commit();
        } else {
            file.cancelWriting();
        }
    }

    if (!written) {
        PLOG_ERROR(QStringLiteral("HistoryStore"),
                   QStringLiteral("save"),
                   QStringLiteral("history_write_failed"),
                   QStringLiteral("append"),
                   QStringLiteral("json_file"),
                   palchron::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", impl->options.path},
                                   {"error", file.errorString().toStdString()}}));
    }
    return written;
}

bool HistoryStore::append(const SaveEvent &event)
{
    return append(toSaveRecord(event));
}

bool HistoryStore::append(const SaveRecord &record)
{
    impl->records.push_back(record);
    impl->patterns = computePatterns(impl->records);

    if (impl->records.size() > impl->options.maxEvents) {
        impl->records.erase(impl->records.begin(),
                            impl->records.end() - static_cast<std::ptrdiff_t>(impl->options.maxEvents));
    }

    PLOG_INFO(QStringLiteral("HistoryStore"),
              QStringLiteral("append"),
              QStringLiteral("save_recorded"),
              QStringLiteral("save_observed"),
              QStringLiteral("json_file"),
              palchron::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"timestamp", record.timestamp},
                              {"activity", toActivityString(record.inferredActivity)},
                              {"records", impl->records.size()}}));
    return save();
}

const std::vector<SaveRecord> &HistoryStore::records() const
{
    return impl->records;
}

std::optional<SaveRecord> HistoryStore::lastRecord() const
{
    if (impl->records.empty()) {
        return std::nullopt;
    }
    return impl->records.back();
}

const Patterns &HistoryStore::patterns() const
{
    return impl->patterns;
}

const std::string &HistoryStore::lastUpdated() const
{
    return impl->lastUpdated;
}

const std::string &HistoryStore::path() const
{
    return impl->options.path;
}

size_t HistoryStore::maxEvents() const
{
    return impl->options.maxEvents;
}

std::vector<SaveRecord> HistoryStore::recentEvents(size_t count) const
{
    return recentRecords(impl->records, count);
}

std::optional<SessionSummary> HistoryStore::sessionSummary() const
{
    return summarizeSession(impl->records);
}

std::optional<HistoryStats> HistoryStore::stats() const
{
    return computeStats(impl->records, impl->patterns);
}

std::vector<std::string> HistoryStore::detectTrends() const
{
    return palchron::detectTrends(impl->records);
}

} // namespace palchron
