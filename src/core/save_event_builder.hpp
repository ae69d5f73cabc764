#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace palchron {

/**
 * Build the SaveEvent for one observed save.
 *
 * - current: the snapshot taken after the save; retained by shared reference
 * - previous: the snapshot from the prior save, or nullptr for the first one
 * - filePath: the save file; its size is read from disk (0 if unreadable)
 * - previousFileSize: size of the save file at the prior observation
 * - previousTimestamp: ISO-8601 timestamp of the prior observation
 *
 * Unreadable files and malformed timestamps degrade to 0 rather than failing.
 * Diff events are reduced to their EventSummary projection.
 */
SaveEvent buildSaveEvent(std::shared_ptr<const Snapshot> current,
                         const Snapshot *previous,
                         const std::string &filePath,
                         int64_t previousFileSize = 0,
                         const std::optional<std::string> &previousTimestamp = std::nullopt);

SaveEvent buildSaveEvent(Snapshot current,
                         const Snapshot *previous,
                         const std::string &filePath,
                         int64_t previousFileSize = 0,
                         const std::optional<std::string> &previousTimestamp = std::nullopt);

// Size of the file in bytes, or 0 if it does not exist or cannot be read.
int64_t fileSizeOrZero(const std::string &path);

} // namespace palchron
