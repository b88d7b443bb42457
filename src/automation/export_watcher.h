#ifndef EXPORTFLOW_EXPORT_WATCHER_H
#define EXPORTFLOW_EXPORT_WATCHER_H

#include <string>
#include <map>
#include <optional>
#include <chrono>
#include <filesystem>
#include "../common/clock.h"

namespace exportflow {
namespace automation {

// File path -> last modification time, taken at one instant
using DirectorySnapshot = std::map<std::string, std::filesystem::file_time_type>;

/**
 * @brief Detects export artifacts written into a directory
 *
 * A file qualifies when its name matches the glob pattern (case-insensitive)
 * and it is absent from the baseline or its modification time is strictly
 * greater than the baseline's. The watcher never modifies the directory.
 */
class ExportWatcher {
public:
    ExportWatcher(IClock& clock, std::chrono::milliseconds pollInterval);

    // Every regular file in the directory; empty for a missing directory
    DirectorySnapshot snapshot(const std::string& directory) const;

    /**
     * @brief Polls until a qualifying file appears
     * @return Absolute path of the newest qualifying file
     * @throws ExportTimeoutError carrying directory, pattern and elapsed time
     */
    std::string awaitExport(const std::string& directory,
                            const DirectorySnapshot& baseline,
                            const std::string& pattern,
                            std::chrono::milliseconds timeout) const;

    /**
     * @brief One scan without waiting
     * @param notBefore When set, files modified earlier than this are ignored
     * @return Newest qualifying file, if any
     */
    std::optional<std::string> findChanged(const std::string& directory,
                                           const DirectorySnapshot& baseline,
                                           const std::string& pattern,
                                           std::optional<std::filesystem::file_time_type> notBefore = std::nullopt) const;

private:
    IClock& m_clock;
    std::chrono::milliseconds m_pollInterval;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_EXPORT_WATCHER_H
