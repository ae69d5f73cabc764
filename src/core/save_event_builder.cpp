#include "core/save_event_builder.hpp"

#include <filesystem>
#include <system_error>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/activity_classifier.hpp"
#include "core/save_classifier.hpp"
#include "core/snapshot_differ.hpp"

namespace palchron {

int64_t fileSizeOrZero(const std::string &path)
{
    if (path.empty()) {
        return 0;
    }
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return 0;
    }
    const auto size = std::filesystem::file_size(path, error);
    if (error) {
        return 0;
    }
    return static_cast<int64_t>(size);
}

SaveEvent buildSaveEvent(std::shared_ptr<const Snapshot> current,
                         const Snapshot *previous,
                         const std::string &filePath,
                         int64_t previousFileSize,
                         const std::optional<std::string> &previousTimestamp)
{
    if (!current) {
        current = std::make_shared<const Snapshot>();
    }

    const QString corrId = palchron::logging::currentCorrelationId().isEmpty()
        ? palchron::logging::saveCorrelationId(QString::fromStdString(filePath),
                                               QString::fromStdString(current->timestamp))
        : palchron::logging::currentCorrelationId();
    palchron::logging::CorrelationScope scope(corrId);

    SaveEvent event;
    event.timestamp = current->timestamp;
    event.filePath = filePath;
    event.fileSize = fileSizeOrZero(filePath);
    event.fileSizeDelta = event.fileSize - previousFileSize;

    if (event.fileSize == 0) {
        PLOG_DEBUG(QStringLiteral("SaveEventBuilder"),
                   QStringLiteral("buildSaveEvent"),
                   QStringLiteral("save_file_size_unavailable"),
                   QStringLiteral("save_observed"),
                   QStringLiteral("filesystem_stat"),
                   palchron::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", filePath}}));
    }

    if (previousTimestamp.has_value()) {
        const auto elapsed = secondsBetween(*previousTimestamp, current->timestamp);
        if (elapsed.has_value()) {
            event.timeSinceLast = *elapsed;
        } else {
            PLOG_DEBUG(QStringLiteral("SaveEventBuilder"),
                       QStringLiteral("buildSaveEvent"),
                       QStringLiteral("timestamp_unparsable"),
                       QStringLiteral("save_observed"),
                       QStringLiteral("iso8601_parse"),
                       palchron::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"previous", *previousTimestamp},
                                       {"current", current->timestamp}}));
        }
    }

    if (previous) {
        event.events = summarizeEvents(diffSnapshots(*previous, *current));
    }

    event.saveType = SaveClassifier::classify(event.timeSinceLast);
    event.inferredActivity = ActivityClassifier::infer(event.events);
    event.snapshot = std::move(current);

    PLOG_INFO(QStringLiteral("SaveEventBuilder"),
              QStringLiteral("buildSaveEvent"),
              QStringLiteral("save_event_built"),
              QStringLiteral("save_observed"),
              QStringLiteral("snapshot_diff"),
              palchron::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", filePath},
                              {"events", event.events.size()},
                              {"saveType", toSaveTypeString(event.saveType)},
                              {"activity", toActivityString(event.inferredActivity)},
                              {"timeSinceLast", event.timeSinceLast}}));
    return event;
}

SaveEvent buildSaveEvent(Snapshot current,
                         const Snapshot *previous,
                         const std::string &filePath,
                         int64_t previousFileSize,
                         const std::optional<std::string> &previousTimestamp)
{
    return buildSaveEvent(std::make_shared<const Snapshot>(std::move(current)),
                          previous, filePath, previousFileSize, previousTimestamp);
}

} // namespace palchron
